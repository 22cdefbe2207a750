// src/controls/control_bindings.cpp
#include "controls/control_bindings.hpp"
#include "controls/action_definitions.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace controls {

namespace {

bool read_file(const std::string& path, std::string& out) {
    if (path.empty()) return false;
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.good()) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

std::string trim(const std::string& s, const char* chars = " \t\r\n") {
    const auto b = s.find_first_not_of(chars);
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(chars);
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip_spaces(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c != ' ') out += c;
    }
    return out;
}

uint32_t read_u32_le(const std::string& blob, size_t off) {
    const auto b = [&](size_t i) { return static_cast<uint32_t>(static_cast<unsigned char>(blob[off + i])); };
    return b(0) | (b(1) << 8) | (b(2) << 16) | (b(3) << 24);
}

const std::map<uint32_t, std::string>& vk_names() {
    static const std::map<uint32_t, std::string> names = [] {
        std::map<uint32_t, std::string> m;
        for (uint32_t c = 'A'; c <= 'Z'; ++c) m[c] = std::string(1, static_cast<char>(c));
        for (uint32_t c = '0'; c <= '9'; ++c) m[c] = std::string(1, static_cast<char>(c));
        for (uint32_t i = 0; i < 12; ++i) m[0x70 + i] = "F" + std::to_string(i + 1);
        for (uint32_t i = 0; i < 10; ++i) m[0x60 + i] = "NUM" + std::to_string(i);
        m[0x08] = "BACKSPACE"; m[0x09] = "TAB";    m[0x0D] = "ENTER";
        m[0x10] = "SHIFT";     m[0x11] = "CTRL";   m[0x12] = "ALT";
        m[0x14] = "CAPSLOCK";  m[0x1B] = "ESC";    m[0x20] = "SPACE";
        m[0x21] = "PGUP";      m[0x22] = "PGDN";   m[0x23] = "END";
        m[0x24] = "HOME";      m[0x25] = "LEFT";   m[0x26] = "UP";
        m[0x27] = "RIGHT";     m[0x28] = "DOWN";   m[0x2D] = "INS";
        m[0x2E] = "DEL";       m[0x5B] = "LWIN";   m[0x5C] = "RWIN";
        m[0x6A] = "NUM*";      m[0x6B] = "NUM+";   m[0x6C] = "NUMSEP";
        m[0x6D] = "NUM-";      m[0x6E] = "NUM.";   m[0x6F] = "NUM/";
        return m;
    }();
    return names;
}

constexpr uint32_t kTypeJoystick = 2;
constexpr uint32_t kTypeKeyboard = 4;

template <typename Decoder>
std::optional<std::string> find_binding(const std::string& blob,
                                        const std::vector<std::string>& names,
                                        uint32_t binding_type,
                                        Decoder decode)
{
    for (const auto& name : names) {
        const std::string pattern = name + '\0';
        size_t pos = blob.find(pattern);
        while (pos != std::string::npos) {
            const size_t start = pos + pattern.size();
            if (start + 16 <= blob.size() && read_u32_le(blob, start + 8) == binding_type) {
                auto combo = decode(read_u32_le(blob, start + 12));
                if (combo) return combo;
            }
            pos = blob.find(pattern, pos + 1);
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// app.ini
// ============================================================================

std::map<std::string, std::string> IniBindingSource::parse_key_values(const std::string& text) {
    std::map<std::string, std::string> kv;
    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        const std::string line = trim(raw);
        if (line.empty() || line[0] == ';' || line[0] == '#' || line[0] == '[') continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = lower(trim(line.substr(0, eq)));
        const std::string value = trim(trim(line.substr(eq + 1)), "\"'");
        if (!key.empty()) kv[key] = value;
    }
    return kv;
}

std::optional<std::string> IniBindingSource::detect(const std::vector<std::string>& keywords,
                                                    const std::map<std::string, std::string>& kv)
{
    for (const auto& kw : keywords) {
        auto it = kv.find(lower(kw));
        if (it != kv.end() && !it->second.empty()) return it->second;
    }
    for (const auto& entry : kv) {
        const std::string key = strip_spaces(entry.first);
        for (const auto& kw : keywords) {
            if (key.find(strip_spaces(lower(kw))) != std::string::npos && !entry.second.empty()) {
                return entry.second;
            }
        }
    }
    return std::nullopt;
}

BindingMap IniBindingSource::load() {
    BindingMap out;
    std::string text;
    if (!read_file(path_, text)) return out;

    const auto kv = parse_key_values(text);
    for (const auto& def : action_definitions()) {
        auto combo = detect(def.keywords, kv);
        if (combo) {
            out[def.name] = ControlBinding{def.name, def.label, combo, name()};
        }
    }
    LOG_DEBUG("[Bindings] %s: %zu keys, %zu actions mapped", path_.c_str(), kv.size(), out.size());
    return out;
}

// ============================================================================
// controls.cfg
// ============================================================================

std::optional<std::string> ControlsCfgBindingSource::decode_keyboard(uint32_t value) {
    if (value == 0) return std::nullopt;

    static const std::pair<uint32_t, const char*> modifier_flags[] = {
        {0x00010000u, "SHIFT"},
        {0x00020000u, "CTRL"},
        {0x00040000u, "ALT"},
        {0x00080000u, "WIN"},
    };

    std::string combo;
    for (const auto& mf : modifier_flags) {
        if (value & mf.first) {
            combo += mf.second;
            combo += '+';
        }
    }

    const auto& names = vk_names();
    auto it = names.find(value & 0xFFu);
    if (it == names.end()) it = names.find(value & 0xFFFFu);
    if (it != names.end()) {
        combo += it->second;
    } else {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "VK_%02X", value & 0xFFFFu);
        combo += buf;
    }
    return combo;
}

std::optional<std::string> ControlsCfgBindingSource::decode_joystick(uint32_t value) {
    if (value == 0) return std::nullopt;
    return "Button" + std::to_string(value);
}

std::optional<ControlsCfgBindingSource::Decoded>
ControlsCfgBindingSource::extract(const std::string& blob, const std::vector<std::string>& names) {
    if (auto kb = find_binding(blob, names, kTypeKeyboard, decode_keyboard)) {
        return Decoded{*kb, false};
    }
    if (auto js = find_binding(blob, names, kTypeJoystick, decode_joystick)) {
        return Decoded{*js, true};
    }
    return std::nullopt;
}

BindingMap ControlsCfgBindingSource::load() {
    BindingMap out;
    std::string blob;
    if (!read_file(path_, blob)) return out;

    for (const auto& def : action_definitions()) {
        auto decoded = extract(blob, def.cfg_names);
        if (decoded) {
            const std::string src = decoded->joystick ? "controls.cfg (joystick)" : "controls.cfg";
            out[def.name] = ControlBinding{def.name, def.label, decoded->combo, src};
        }
    }
    LOG_DEBUG("[Bindings] %s: %zu bytes, %zu actions mapped", path_.c_str(), blob.size(), out.size());
    return out;
}

// ============================================================================
// YAML override
// ============================================================================

BindingMap YamlBindingSource::load() {
    BindingMap out;
    if (path_.empty()) return out;
    std::ifstream check(path_);
    if (!check.good()) return out;
    check.close();

    try {
        YAML::Node root = YAML::LoadFile(path_);
        YAML::Node map = root["bindings"] ? root["bindings"] : root;
        if (!map.IsMap()) {
            LOG_WARN("[Bindings] %s: expected a map of action -> combo", path_.c_str());
            return out;
        }

        for (const auto& entry : map) {
            const std::string action = entry.first.as<std::string>();
            const ActionDefinition* def = find_action_definition(action);
            if (!def) {
                LOG_WARN("[Bindings] %s: unknown action '%s' ignored", path_.c_str(), action.c_str());
                continue;
            }
            if (entry.second.IsNull()) continue;

            const std::string combo = trim(entry.second.as<std::string>());
            if (!combo.empty()) {
                out[action] = ControlBinding{def->name, def->label, combo, name()};
            }
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("[Bindings] Failed to load override file %s: %s", path_.c_str(), e.what());
        out.clear();
    }
    return out;
}

// ============================================================================
// ControlBindingStore
// ============================================================================

ControlBindingStore::ControlBindingStore(std::vector<std::unique_ptr<BindingSource>> sources,
                                         utils::Clock& clock,
                                         Config config)
    : sources_(std::move(sources))
    , clock_(clock)
    , config_(config)
    , snapshot_(std::make_shared<const BindingMap>(default_bindings()))
{
}

BindingMap ControlBindingStore::default_bindings() {
    BindingMap m;
    for (const auto& def : action_definitions()) {
        m[def.name] = ControlBinding{def.name, def.label, std::nullopt, "default"};
    }
    return m;
}

void ControlBindingStore::reload(bool force) {
    std::lock_guard<std::mutex> lock(reload_mu_);

    const double now = clock_.now();
    if (!force && loaded_at_s_ >= 0.0 && (now - loaded_at_s_) < config_.reload_cooldown_s) {
        return;
    }
    loaded_at_s_ = now;

    auto merged = std::make_shared<BindingMap>(default_bindings());
    for (const auto& source : sources_) {
        for (auto& entry : source->load()) {
            if (entry.second.combo) {
                (*merged)[entry.first] = std::move(entry.second);
            }
        }
    }

    size_t mapped = 0;
    for (const auto& b : *merged) {
        if (b.second.combo) ++mapped;
    }
    LOG_DEBUG("[Bindings] Reloaded: %zu/%zu actions mapped", mapped, merged->size());

    std::lock_guard<std::mutex> snap_lock(snapshot_mu_);
    snapshot_ = std::move(merged);
}

std::shared_ptr<const BindingMap> ControlBindingStore::current() const {
    std::lock_guard<std::mutex> lock(snapshot_mu_);
    return snapshot_;
}

std::shared_ptr<const BindingMap> ControlBindingStore::bindings(bool force) {
    reload(force);
    return current();
}

ControlBinding ControlBindingStore::resolve(const std::string& action) {
    const auto snap = bindings();

    auto it = snap->find(action);
    if (it == snap->end()) {
        return ControlBinding{action, action, std::nullopt, "unknown"};
    }

    ControlBinding binding = it->second;
    if (action == "enter_car" && !binding.combo) {
        auto reset = snap->find("reset_car");
        if (reset != snap->end() && reset->second.combo) {
            LOG_DEBUG("[Bindings] enter_car unmapped, using reset_car binding %s",
                      reset->second.combo->c_str());
            binding.combo = reset->second.combo;
            binding.source = reset->second.source + " (reset_car)";
        }
    }
    return binding;
}

} // namespace controls
