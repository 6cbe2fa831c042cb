#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include <userver/components/minimal_component_list.hpp>
#include <userver/components/run.hpp>

#include "controls_runner/controls_runner.hpp"

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    po::options_description desc("payment_controls options");
    desc.add_options()
        ("help,h", "print this help")
        ("config,c", po::value<std::string>()->required(), "static config path")
        ("config_vars", po::value<std::string>(), "config vars path")
        ("config_vars_override", po::value<std::string>(), "config vars override path");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << desc << std::endl;
        return 1;
    }

    std::optional<std::string> config_vars;
    if (vm.count("config_vars")) {
        config_vars = vm["config_vars"].as<std::string>();
    }
    std::optional<std::string> config_vars_override;
    if (vm.count("config_vars_override")) {
        config_vars_override = vm["config_vars_override"].as<std::string>();
    }

    const auto component_list = userver::components::MinimalComponentList()
        .Append<payment_controls::ControlsRunner>();

    try {
        userver::components::RunOnce(vm["config"].as<std::string>(), config_vars,
                                     config_vars_override, component_list);
    } catch (const std::exception& e) {
        std::cerr << "payment_controls: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
