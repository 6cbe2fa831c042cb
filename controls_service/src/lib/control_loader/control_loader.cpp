#include "control_loader.hpp"

#include <filesystem>

#include <fmt/format.h>
#include <userver/formats/yaml/exception.hpp>
#include <userver/formats/yaml/serialize.hpp>
#include <userver/logging/log.hpp>

#include "control_factory/control_factory.hpp"
#include "rule_utils/errors.hpp"

namespace payment_controls {

namespace {

using userver::formats::yaml::Value;

controls::LiteralValue ParseLiteral(const Value& value) {
    controls::LiteralValue literal;
    if (value.IsNull()) {
        return literal;
    }
    if (value.IsBool()) {
        literal.set_bool_value(value.As<bool>());
    } else if (value.IsInt64()) {
        literal.set_int_value(value.As<int64_t>());
    } else if (value.IsDouble()) {
        literal.set_float_value(value.As<double>());
    } else if (value.IsString()) {
        literal.set_string_value(value.As<std::string>());
    } else {
        throw ConfigError(fmt::format("{}: expected a scalar value", value.GetPath()));
    }
    return literal;
}

controls::Condition ParseCondition(const std::string& key, const Value& value) {
    controls::Condition condition;
    condition.set_key(key);
    if (value.IsArray()) {
        auto* list = condition.mutable_list();
        for (const auto& element : value) {
            *list->add_values() = ParseLiteral(element);
        }
    } else {
        *condition.mutable_literal() = ParseLiteral(value);
    }
    return condition;
}

std::string RequiredString(const Value& item, std::string_view field) {
    const auto value = item[std::string(field)];
    if (value.IsMissing() || value.IsNull()) {
        throw ConfigError(fmt::format("{}: missing required field '{}'", item.GetPath(), field));
    }
    return value.As<std::string>();
}

controls::ControlConfig ParseControl(const Value& item) {
    if (!item.IsObject()) {
        throw ConfigError(fmt::format("{}: control record must be a mapping", item.GetPath()));
    }

    controls::ControlConfig config;
    config.set_control_id(RequiredString(item, "control_id"));

    const auto rail_name = RequiredString(item, "rail");
    controls::Rail rail{};
    if (!controls::Rail_Parse(rail_name, &rail) || rail == controls::RAIL_UNSPECIFIED) {
        throw ConfigError(fmt::format("{}: control '{}' has unknown rail '{}'",
                                      item.GetPath(), config.control_id(), rail_name));
    }
    config.set_rail(rail);

    config.set_severity(item["severity"].As<std::string>(std::string{kDefaultSeverity}));
    config.set_action(item["action"].As<std::string>(std::string{kDefaultAction}));
    config.set_description(item["description"].As<std::string>(""));

    const auto conditions = item["conditions"];
    if (conditions.IsMissing() || conditions.IsNull()) {
        return config;
    }
    if (!conditions.IsObject()) {
        throw ConfigError(fmt::format("{}: conditions must be a mapping", conditions.GetPath()));
    }
    for (auto it = conditions.begin(); it != conditions.end(); ++it) {
        *config.add_conditions() = ParseCondition(it.GetName(), *it);
    }
    return config;
}

}  // namespace

controls::ControlSet ParseControlSet(const Value& document) {
    if (!document.IsArray()) {
        throw ConfigError("control set must be a YAML sequence of control records");
    }

    controls::ControlSet control_set;
    try {
        for (const auto& item : document) {
            *control_set.add_controls() = ParseControl(item);
        }
    } catch (const userver::formats::yaml::Exception& e) {
        throw ConfigError(fmt::format("malformed control set: {}", e.what()));
    }
    return control_set;
}

controls::ControlSet LoadControlSet(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw MissingInputError("controls file not found: " + path);
    }

    Value document;
    try {
        document = userver::formats::yaml::blocking::FromFile(path);
    } catch (const userver::formats::yaml::Exception& e) {
        throw ConfigError(fmt::format("cannot parse {}: {}", path, e.what()));
    }

    try {
        return ParseControlSet(document);
    } catch (const ConfigError& e) {
        throw ConfigError(fmt::format("{}: {}", path, e.what()));
    }
}

std::vector<Control> LoadControls(const std::string& path) {
    auto controls = ControlFactory::CreateControls(LoadControlSet(path));
    LOG_INFO() << "Loaded " << controls.size() << " controls from " << path;
    return controls;
}

}  // namespace payment_controls
