// src/controls/key_combo.cpp
#include "controls/key_combo.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace controls {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> split_tokens(const std::string& text) {
    std::string spaced = text;
    std::replace(spaced.begin(), spaced.end(), '+', ' ');

    std::vector<std::string> tokens;
    std::istringstream in(spaced);
    std::string tok;
    while (in >> tok) {
        tokens.push_back(tok);
    }
    return tokens;
}

} // namespace

std::optional<std::string> normalize_modifier(const std::string& token) {
    const std::string t = to_upper(token);
    if (t == "CTRL" || t == "CONTROL" || t == "LCTRL" || t == "RCTRL") return std::string("CTRL");
    if (t == "SHIFT" || t == "LSHIFT" || t == "RSHIFT") return std::string("SHIFT");
    if (t == "ALT" || t == "LALT" || t == "RALT") return std::string("ALT");
    if (t == "WIN" || t == "LWIN" || t == "RWIN" || t == "META") return std::string("WIN");
    return std::nullopt;
}

std::optional<KeyCombo> KeyCombo::parse(const std::string& text) {
    const auto tokens = split_tokens(text);
    if (tokens.empty()) {
        return std::nullopt;
    }

    KeyCombo combo;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        auto mod = normalize_modifier(tokens[i]);
        if (!mod) {
            return std::nullopt;
        }
        if (std::find(combo.modifiers.begin(), combo.modifiers.end(), *mod) == combo.modifiers.end()) {
            combo.modifiers.push_back(*mod);
        }
    }

    // A lone modifier ("SHIFT") is a valid main key.
    combo.key = to_upper(tokens.back());
    if (combo.key.rfind("BUTTON", 0) == 0) {
        combo.key = "Button" + tokens.back().substr(6);
    }
    return combo;
}

std::string KeyCombo::to_string() const {
    std::string out;
    for (const auto& m : modifiers) {
        out += m;
        out += '+';
    }
    out += key;
    return out;
}

bool KeyCombo::is_joystick() const {
    return key.rfind("Button", 0) == 0;
}

std::string format_key_message(const std::optional<std::string>& combo) {
    if (!combo) {
        return "no key";
    }
    const auto tokens = split_tokens(*combo);
    if (tokens.empty()) {
        return "no key";
    }

    const std::string main_key = to_upper(tokens.back());
    if (tokens.size() == 1) {
        return "pressed the " + main_key + " key";
    }

    std::string mods;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (!mods.empty()) mods += '+';
        mods += to_upper(tokens[i]);
    }
    return "pressed " + mods + "+" + main_key;
}

} // namespace controls
