// src/controls/action_definitions.cpp
#include "controls/action_definitions.hpp"

namespace controls {

const std::vector<ActionDefinition>& action_definitions() {
    static const std::vector<ActionDefinition> defs = {
        {"pit_speed_limiter", "Pit Speed Limiter",
         {"pit speed limiter", "pit limiter", "pitspeedlimiter", "pit_speed_limiter"},
         {"PitSpeedLimiter"}},
        {"starter", "Starter",
         {"starter", "start engine"},
         {"Starter"}},
        {"ignition", "Ignition",
         {"ignition", "toggle ignition"},
         {"Ignition"}},
        {"request_pit", "Request Pit Service",
         {"request pit service", "pit service request", "pit service"},
         {"FuelToEndToggle", "InLapToggle"}},
        {"quick_repair", "Quick Repair",
         {"fast repair", "quick repair"},
         {"SaveActiveReset", "RunActiveReset"}},
        {"clear_flags", "Clear Penalties",
         {"clear penalties", "clear black flags", "clear penalties request"},
         {"TellTaleReset", "RunActiveReset"}},
        {"reset_car", "Reset Car",
         {"reset car", "tow car", "reset"},
         {"RunActiveReset", "SaveActiveReset", "Reset"}},
        {"enter_car", "Enter Car",
         {"enter car", "get in car", "enter vehicle"},
         {"EnterCar", "Enter"}},
    };
    return defs;
}

const ActionDefinition* find_action_definition(const std::string& name) {
    for (const auto& d : action_definitions()) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

} // namespace controls
