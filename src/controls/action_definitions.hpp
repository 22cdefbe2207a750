// src/controls/action_definitions.hpp
#pragma once

#include <string>
#include <vector>

namespace controls {

// A simulator action that can be bound to a key.
struct ActionDefinition {
    std::string name;                    // "reset_car"
    std::string label;                   // "Reset Car"
    std::vector<std::string> keywords;   // app.ini key names, lower case
    std::vector<std::string> cfg_names;  // controls.cfg control names, in priority order
};

const std::vector<ActionDefinition>& action_definitions();

// nullptr when name is not a bindable action
const ActionDefinition* find_action_definition(const std::string& name);

} // namespace controls
