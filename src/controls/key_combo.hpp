// src/controls/key_combo.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace controls {

/**
 * KeyCombo - a parsed key combination such as "CTRL+SHIFT+R".
 *
 * Accepted input separates keys with '+' or whitespace, in any case:
 *   "CTRL+R", "ctrl r", "Shift + F3", "Button12"
 * Modifiers are normalized to CTRL, SHIFT, ALT, WIN. The final token is the
 * main key; every token before it must be a modifier.
 */
struct KeyCombo {
    std::vector<std::string> modifiers;   // in press order
    std::string key;                      // upper-cased main key

    static std::optional<KeyCombo> parse(const std::string& text);

    // Canonical "MOD+MOD+KEY" form
    std::string to_string() const;

    bool is_joystick() const;
};

// Normalized modifier name for a token, or nullopt if it is not a modifier.
std::optional<std::string> normalize_modifier(const std::string& token);

/**
 * Human-readable description of a key press, used in action results:
 *   "R"       -> "pressed the R key"
 *   "CTRL+R"  -> "pressed CTRL+R"
 *   unset     -> "no key"
 */
std::string format_key_message(const std::optional<std::string>& combo);

} // namespace controls
