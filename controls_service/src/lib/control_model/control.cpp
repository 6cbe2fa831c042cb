#include "control.hpp"

namespace payment_controls {

std::string RailName(controls::Rail rail) {
    return std::string(controls::Rail_Name(rail));
}

std::string ActionName(controls::Action action) {
    return std::string(controls::Action_Name(action));
}

controls::Action ParseAction(std::string_view action) {
    controls::Action parsed{};
    if (!controls::Action_Parse(std::string(action), &parsed) ||
        parsed == controls::ACTION_UNSPECIFIED) {
        return controls::ALLOW;
    }
    return parsed;
}

bool IsKnownAction(std::string_view action) {
    controls::Action parsed{};
    return controls::Action_Parse(std::string(action), &parsed) &&
           parsed != controls::ACTION_UNSPECIFIED;
}

}  // namespace payment_controls
