// test/test_control_bindings.cpp
/**
 * Unit Test: ControlBindingStore and binding sources
 *
 * Test Coverage:
 *   1. app.ini keyword detection
 *   2. controls.cfg binary decoding (keyboard, modifiers, joystick)
 *   3. YAML override file
 *   4. Merge precedence and enter_car fallback
 *   5. Reload cooldown and snapshot stability
 */

#include "controls/control_bindings.hpp"
#include "fakes.hpp"
#include "test_helpers.hpp"
#include <cstdint>
#include <cstdio>
#include <fstream>

using namespace controls;

namespace {

void write_file(const char* path, const std::string& content) {
    std::ofstream f(path, std::ios::out | std::ios::binary | std::ios::trunc);
    f << content;
}

void put_u32(std::string& blob, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        blob += static_cast<char>((v >> (8 * i)) & 0xFFu);
    }
}

// One controls.cfg record: name, NUL, four little-endian words.
void put_control(std::string& blob, const std::string& name, uint32_t type, uint32_t value) {
    blob += name;
    blob += '\0';
    put_u32(blob, 0);
    put_u32(blob, 0);
    put_u32(blob, type);
    put_u32(blob, value);
}

constexpr uint32_t kKeyboard = 4;
constexpr uint32_t kJoystick = 2;
constexpr uint32_t kShift = 0x00010000u;
constexpr uint32_t kCtrl = 0x00020000u;

// Counts loads and returns whatever map the test put in it.
class CountingSource : public BindingSource {
public:
    std::string name() const override { return "counting"; }
    BindingMap load() override {
        ++loads;
        return map;
    }

    BindingMap map;
    int loads = 0;
};

ControlBinding bind(const std::string& action, const std::string& combo, const std::string& source) {
    return ControlBinding{action, action, combo, source};
}

} // namespace

// ============================================================================
// app.ini
// ============================================================================

bool test_ini_detection() {
    const char* path = "/tmp/test_rig_bindings_app.ini";
    write_file(path,
               "[Controls]\n"
               "; comment line\n"
               "Reset Car=SHIFT+R\n"
               "ignition = I\n"
               "Pit Speed Limiter=\"A\"\n"
               "toggle starter key = S\n"
               "unrelated=Q\n");

    IniBindingSource src(path);
    auto map = src.load();
    std::remove(path);

    TEST_ASSERT(map.count("reset_car") && *map["reset_car"].combo == "SHIFT+R", "exact keyword match");
    TEST_ASSERT(map.count("ignition") && *map["ignition"].combo == "I", "whitespace trimmed");
    TEST_ASSERT(map.count("pit_speed_limiter") && *map["pit_speed_limiter"].combo == "A", "quotes stripped");
    TEST_ASSERT(map.count("starter") && *map["starter"].combo == "S", "substring keyword match");
    TEST_ASSERT(map["starter"].source == "app.ini", "source name");
    TEST_ASSERT(!map.count("enter_car"), "no entry for unmapped action");
    return true;
}

bool test_ini_missing_file() {
    IniBindingSource src("/tmp/definitely_missing_app.ini");
    TEST_ASSERT(src.load().empty(), "missing file yields empty map");
    return true;
}

bool test_ini_parse_key_values() {
    auto kv = IniBindingSource::parse_key_values("  Key A = v1 \n#x=y\nnoequals\n=empty\n");
    TEST_ASSERT(kv.size() == 1, "only one valid pair");
    TEST_ASSERT(kv["key a"] == "v1", "key lower-cased, value trimmed");
    return true;
}

// ============================================================================
// controls.cfg
// ============================================================================

bool test_cfg_decode_keyboard() {
    TEST_ASSERT(ControlsCfgBindingSource::decode_keyboard('R') == std::optional<std::string>("R"), "plain key");
    TEST_ASSERT(ControlsCfgBindingSource::decode_keyboard(kCtrl | 'R') == std::optional<std::string>("CTRL+R"),
                "ctrl flag");
    TEST_ASSERT(ControlsCfgBindingSource::decode_keyboard(kShift | kCtrl | 0x72) ==
                    std::optional<std::string>("SHIFT+CTRL+F3"),
                "modifier order and function key");
    TEST_ASSERT(ControlsCfgBindingSource::decode_keyboard(0xE2) == std::optional<std::string>("VK_E2"),
                "unknown virtual key");
    TEST_ASSERT(!ControlsCfgBindingSource::decode_keyboard(0).has_value(), "zero is unbound");
    TEST_ASSERT(ControlsCfgBindingSource::decode_joystick(12) == std::optional<std::string>("Button12"),
                "joystick button");
    return true;
}

bool test_cfg_keyboard_preferred_over_joystick() {
    std::string blob = "HEADER";
    put_control(blob, "RunActiveReset", kJoystick, 7);
    put_control(blob, "Reset", kKeyboard, kShift | 'R');

    auto d = ControlsCfgBindingSource::extract(blob, {"RunActiveReset", "SaveActiveReset", "Reset"});
    TEST_ASSERT(d.has_value(), "binding found");
    TEST_ASSERT(d->combo == "SHIFT+R", "keyboard binding wins over an earlier joystick one");
    TEST_ASSERT(!d->joystick, "keyboard flag");

    std::string joy_only;
    put_control(joy_only, "EnterCar", kJoystick, 3);
    auto j = ControlsCfgBindingSource::extract(joy_only, {"EnterCar"});
    TEST_ASSERT(j && j->combo == "Button3" && j->joystick, "joystick fallback");
    return true;
}

bool test_cfg_truncated_record_ignored() {
    std::string blob;
    blob += "Ignition";
    blob += '\0';
    put_u32(blob, 0);
    put_u32(blob, kKeyboard);   // only two words follow the name
    TEST_ASSERT(!ControlsCfgBindingSource::extract(blob, {"Ignition"}).has_value(), "short record ignored");
    return true;
}

bool test_cfg_load_file() {
    const char* path = "/tmp/test_rig_bindings_controls.cfg";
    std::string blob;
    put_control(blob, "Ignition", kKeyboard, 'I');
    put_control(blob, "Starter", kKeyboard, 'S');
    put_control(blob, "EnterCar", kJoystick, 4);
    write_file(path, blob);

    ControlsCfgBindingSource src(path);
    auto map = src.load();
    std::remove(path);

    TEST_ASSERT(map.count("ignition") && *map["ignition"].combo == "I", "ignition decoded");
    TEST_ASSERT(map["ignition"].source == "controls.cfg", "keyboard source");
    TEST_ASSERT(map.count("enter_car") && *map["enter_car"].combo == "Button4", "joystick decoded");
    TEST_ASSERT(map["enter_car"].source == "controls.cfg (joystick)", "joystick source");
    return true;
}

// ============================================================================
// YAML override
// ============================================================================

bool test_yaml_override() {
    const char* path = "/tmp/test_rig_bindings_override.yaml";
    write_file(path,
               "bindings:\n"
               "  reset_car: \"R\"\n"
               "  enter_car: ~\n"
               "  fly_away: \"F\"\n"
               "  request_pit: \"  CTRL+P  \"\n");

    YamlBindingSource src(path);
    auto map = src.load();
    std::remove(path);

    TEST_ASSERT(map.size() == 2, "null and unknown entries skipped");
    TEST_ASSERT(*map["reset_car"].combo == "R", "reset_car");
    TEST_ASSERT(*map["request_pit"].combo == "CTRL+P", "value trimmed");
    TEST_ASSERT(map["reset_car"].label == "Reset Car", "label from action table");
    TEST_ASSERT(map["reset_car"].source == "override", "source name");
    return true;
}

bool test_yaml_corrupt_file() {
    const char* path = "/tmp/test_rig_bindings_corrupt.yaml";
    write_file(path, "bindings: [unclosed\n");
    YamlBindingSource src(path);
    auto map = src.load();
    std::remove(path);
    TEST_ASSERT(map.empty(), "corrupt file yields empty map");
    return true;
}

// ============================================================================
// Store
// ============================================================================

bool test_defaults_all_unmapped() {
    auto defaults = ControlBindingStore::default_bindings();
    TEST_ASSERT(defaults.size() == 8, "every bindable action present");
    for (const auto& b : defaults) {
        TEST_ASSERT(!b.second.combo.has_value(), "default is unmapped: " + b.first);
        TEST_ASSERT(b.second.source == "default", "default source");
    }
    return true;
}

bool test_precedence() {
    fakes::ManualClock clock;
    auto low = std::make_unique<CountingSource>();
    auto high = std::make_unique<CountingSource>();
    low->map["reset_car"] = bind("reset_car", "SHIFT+R", "low");
    low->map["ignition"] = bind("ignition", "I", "low");
    high->map["reset_car"] = bind("reset_car", "R", "high");
    high->map["ignition"] = ControlBinding{"ignition", "Ignition", std::nullopt, "high"};

    std::vector<std::unique_ptr<BindingSource>> sources;
    sources.push_back(std::move(low));
    sources.push_back(std::move(high));
    ControlBindingStore store(std::move(sources), clock, {});

    auto reset = store.resolve("reset_car");
    TEST_ASSERT(reset.combo && *reset.combo == "R", "later source wins");
    TEST_ASSERT(reset.source == "high", "winning source recorded");

    auto ign = store.resolve("ignition");
    TEST_ASSERT(ign.combo && *ign.combo == "I", "unmapped entry does not erase a lower binding");
    TEST_ASSERT(ign.source == "low", "lower source kept");
    return true;
}

bool test_enter_car_fallback() {
    fakes::ManualClock clock;
    auto src = std::make_unique<CountingSource>();
    CountingSource* raw = src.get();
    raw->map["reset_car"] = bind("reset_car", "SHIFT+R", "override");

    std::vector<std::unique_ptr<BindingSource>> sources;
    sources.push_back(std::move(src));
    ControlBindingStore store(std::move(sources), clock, {});

    auto enter = store.resolve("enter_car");
    TEST_ASSERT(enter.combo && *enter.combo == "SHIFT+R", "falls back to reset_car combo");
    TEST_ASSERT(enter.source == "override (reset_car)", "fallback noted in source");
    TEST_ASSERT(enter.label == "Enter Car", "label stays enter_car's");

    raw->map["enter_car"] = bind("enter_car", "E", "override");
    store.reload(true);
    auto own = store.resolve("enter_car");
    TEST_ASSERT(own.combo && *own.combo == "E", "own binding preferred");
    return true;
}

bool test_unknown_action() {
    fakes::ManualClock clock;
    ControlBindingStore store({}, clock, {});
    auto b = store.resolve("fly_away");
    TEST_ASSERT(!b.combo.has_value(), "unknown action unmapped");
    TEST_ASSERT(b.source == "unknown", "unknown source");
    TEST_ASSERT(b.label == "fly_away", "label is the action name");
    return true;
}

bool test_reload_cooldown() {
    fakes::ManualClock clock;
    auto src = std::make_unique<CountingSource>();
    CountingSource* raw = src.get();
    std::vector<std::unique_ptr<BindingSource>> sources;
    sources.push_back(std::move(src));
    ControlBindingStore store(std::move(sources), clock, ControlBindingStore::Config{5.0});

    store.resolve("ignition");
    TEST_ASSERT(raw->loads == 1, "first resolve loads");
    store.resolve("starter");
    clock.advance(4.9);
    store.resolve("ignition");
    TEST_ASSERT(raw->loads == 1, "no reload inside cooldown");
    clock.advance(0.2);
    store.resolve("ignition");
    TEST_ASSERT(raw->loads == 2, "reload after cooldown");
    store.reload(true);
    TEST_ASSERT(raw->loads == 3, "forced reload ignores cooldown");
    return true;
}

bool test_snapshot_stable_across_reload() {
    fakes::ManualClock clock;
    auto src = std::make_unique<CountingSource>();
    CountingSource* raw = src.get();
    raw->map["ignition"] = bind("ignition", "I", "counting");
    std::vector<std::unique_ptr<BindingSource>> sources;
    sources.push_back(std::move(src));
    ControlBindingStore store(std::move(sources), clock, {});

    auto before = store.bindings();
    raw->map["ignition"] = bind("ignition", "K", "counting");
    auto after = store.bindings(true);

    TEST_ASSERT(*before->at("ignition").combo == "I", "held snapshot unchanged");
    TEST_ASSERT(*after->at("ignition").combo == "K", "new snapshot has new binding");
    return true;
}

int main() {
    int total = 0, passed = 0, failed = 0;

    print_header("Control Binding Unit Tests");

    RUN_TEST(test_ini_detection);
    RUN_TEST(test_ini_missing_file);
    RUN_TEST(test_ini_parse_key_values);
    RUN_TEST(test_cfg_decode_keyboard);
    RUN_TEST(test_cfg_keyboard_preferred_over_joystick);
    RUN_TEST(test_cfg_truncated_record_ignored);
    RUN_TEST(test_cfg_load_file);
    RUN_TEST(test_yaml_override);
    RUN_TEST(test_yaml_corrupt_file);
    RUN_TEST(test_defaults_all_unmapped);
    RUN_TEST(test_precedence);
    RUN_TEST(test_enter_car_fallback);
    RUN_TEST(test_unknown_action);
    RUN_TEST(test_reload_cooldown);
    RUN_TEST(test_snapshot_stable_across_reload);

    return print_summary(total, passed, failed);
}
