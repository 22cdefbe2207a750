// src/controls/control_bindings.hpp
#pragma once

#include "utils/clock.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace controls {

struct ControlBinding {
    std::string action_name;
    std::string label;
    std::optional<std::string> combo;   // nullopt when unmapped
    std::string source;                 // "default", "app.ini", "controls.cfg", "override", ...
};

using BindingMap = std::map<std::string, ControlBinding>;

/**
 * BindingSource - one place key bindings can come from.
 *
 * load() returns only the actions this source has a combo for. A missing file
 * is not an error (empty map); a corrupt one is logged and yields an empty map.
 */
class BindingSource {
public:
    virtual ~BindingSource() = default;

    virtual std::string name() const = 0;
    virtual BindingMap load() = 0;
};

/**
 * IniBindingSource - scans a simulator app.ini for key=value lines whose key
 * matches an action keyword. Exact keyword match wins, otherwise the first
 * key containing a keyword (spaces ignored).
 */
class IniBindingSource : public BindingSource {
public:
    explicit IniBindingSource(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "app.ini"; }
    BindingMap load() override;

    // Exposed for tests
    static std::map<std::string, std::string> parse_key_values(const std::string& text);
    static std::optional<std::string> detect(const std::vector<std::string>& keywords,
                                             const std::map<std::string, std::string>& kv);

private:
    std::string path_;
};

/**
 * ControlsCfgBindingSource - decodes the simulator's binary controls.cfg.
 *
 * Each control is stored as its ASCII name, a NUL, then four little-endian
 * uint32 words. The third word is the binding type (4 = keyboard,
 * 2 = joystick button) and the fourth its value. Keyboard values carry
 * modifier flags in bits 16-19 and a virtual-key code in the low byte.
 */
class ControlsCfgBindingSource : public BindingSource {
public:
    explicit ControlsCfgBindingSource(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "controls.cfg"; }
    BindingMap load() override;

    struct Decoded {
        std::string combo;
        bool joystick = false;
    };

    // First keyboard binding for any of names, else first joystick binding.
    static std::optional<Decoded> extract(const std::string& blob,
                                          const std::vector<std::string>& names);
    static std::optional<std::string> decode_keyboard(uint32_t value);
    static std::optional<std::string> decode_joystick(uint32_t value);

private:
    std::string path_;
};

/**
 * YamlBindingSource - operator override file:
 *
 *   bindings:
 *     reset_car: "R"
 *     enter_car: "CTRL+E"
 */
class YamlBindingSource : public BindingSource {
public:
    explicit YamlBindingSource(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "override"; }
    BindingMap load() override;

private:
    std::string path_;
};

/**
 * ControlBindingStore - resolves action names to key combos.
 *
 * Sources are merged lowest precedence first on top of a default map in which
 * every known action is unmapped; a later source only overrides an action it
 * has a combo for. Reloads happen at most once per cooldown unless forced.
 * Readers receive an immutable snapshot, so a concurrent reload never changes
 * a map that is in use.
 */
class ControlBindingStore {
public:
    struct Config {
        double reload_cooldown_s = 5.0;
    };

    ControlBindingStore(std::vector<std::unique_ptr<BindingSource>> sources,
                        utils::Clock& clock,
                        Config config);

    // Reload if the cooldown has elapsed, or unconditionally when force is set.
    void reload(bool force = false);

    // Current snapshot, reloading first if due.
    std::shared_ptr<const BindingMap> bindings(bool force = false);

    /**
     * Binding for an action. enter_car falls back to the reset_car combo when
     * it has none of its own. Unknown actions come back unmapped with source
     * "unknown".
     */
    ControlBinding resolve(const std::string& action);

    static BindingMap default_bindings();

private:
    std::vector<std::unique_ptr<BindingSource>> sources_;
    utils::Clock& clock_;
    Config config_;

    std::mutex reload_mu_;                      // one reload at a time
    double loaded_at_s_ = -1.0;

    mutable std::mutex snapshot_mu_;            // guards the pointer only
    std::shared_ptr<const BindingMap> snapshot_;

    std::shared_ptr<const BindingMap> current() const;
};

} // namespace controls
