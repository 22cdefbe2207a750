// test/test_rig_config.cpp
/**
 * Unit Test: RigConfig
 *
 * Tests YAML loading, validation, and default configuration.
 *
 * Test Coverage:
 *   1. Default configuration generation
 *   2. Valid YAML loading
 *   3. Missing file fallback to defaults
 *   4. Validation (transport, push intervals, log level, poll rate)
 */

#include "config/rig_config.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

bool is_close(double actual, double expected, double tolerance = 1e-9) {
    return std::abs(actual - expected) < tolerance;
}

// Writes body to path; returns false if the file could not be created
bool write_file(const char* path, const std::string& body) {
    std::ofstream f(path);
    if (!f.good()) return false;
    f << body;
    return f.good();
}

// Expect load() to throw with a message mentioning `needle`
void expect_rejected(TestResult& result, const char* path, const std::string& yaml,
                     const std::string& needle, const std::string& what) {
    if (!write_file(path, yaml)) {
        result.fail("Could not write " + std::string(path));
        return;
    }
    try {
        config::RigConfig::load(path);
        result.fail(what + ": accepted");
    } catch (const std::exception& e) {
        std::string msg = e.what();
        if (msg.find(needle) != std::string::npos) {
            result.pass(what + ": " + msg);
        } else {
            result.fail(what + ": unexpected message: " + msg);
        }
    }
    std::remove(path);
}

// Test 1: Default configuration
void test_default_config(TestResult& result) {
    std::cout << "\n=== Test 1: Default Configuration ===\n";

    auto cfg = config::RigConfig::get_default();

    if (!cfg.device.id.empty()) {
        result.pass("Default device id: " + cfg.device.id);
    } else {
        result.fail("Default device id is empty");
    }

    if (cfg.backend.transport == "rest") {
        result.pass("Default transport is rest");
    } else {
        result.fail("Default transport: " + cfg.backend.transport);
    }

    if (cfg.queue.always_allowed.count("enter_car") == 1 && cfg.queue.always_allowed.size() == 1) {
        result.pass("enter_car is the only always-allowed action");
    } else {
        result.fail("Unexpected always-allowed set");
    }

    if (cfg.state.resync_interval_s > cfg.state.min_push_interval_s) {
        result.pass("Resync interval above the push interval");
    } else {
        result.fail("Resync interval not above the push interval");
    }

    try {
        cfg.validate();
        result.pass("Default configuration validates");
    } catch (const std::exception& e) {
        result.fail(std::string("Default configuration rejected: ") + e.what());
    }
}

// Test 2: Valid YAML loading
void test_valid_yaml(TestResult& result) {
    std::cout << "\n=== Test 2: Valid YAML Loading ===\n";

    const char* temp_yaml = "/tmp/test_rig_config_valid.yaml";
    const bool written = write_file(temp_yaml, R"(
device:
  id: rig-07
  api_key: secret
backend:
  url: http://backend.local:8080
  transport: table
commands:
  poll_interval_s: 5
  stale_grace_s: 120
  cancel_pending_on_start: false
  always_allowed: [enter_car, ignition]
state:
  min_push_interval_s: 2
  resync_interval_s: 60
  verify_attempts: 5
telemetry:
  poll_hz: 20
dispatcher:
  engine_running_rpm: 800
  reset_max_hold_s: 4
controls:
  override_path: /tmp/none.yaml
  reload_cooldown_s: 2
logging:
  level: debug
)");
    if (!written) {
        result.fail("Could not write temp YAML");
        return;
    }

    try {
        auto cfg = config::RigConfig::load(temp_yaml);
        result.pass("YAML loaded");

        if (cfg.device.id == "rig-07" && cfg.device.api_key == "secret") {
            result.pass("Device section");
        } else {
            result.fail("Device section not applied");
        }

        if (cfg.backend.transport == "table" && cfg.backend.url == "http://backend.local:8080") {
            result.pass("Backend section");
        } else {
            result.fail("Backend section not applied");
        }

        if (is_close(cfg.queue.poll_interval_s, 5.0) && is_close(cfg.queue.stale_grace_s, 120.0) &&
            !cfg.queue.cancel_pending_on_start && cfg.queue.always_allowed.size() == 2) {
            result.pass("Command section");
        } else {
            result.fail("Command section not applied");
        }

        if (is_close(cfg.state.min_push_interval_s, 2.0) && cfg.state_verify_attempts == 5) {
            result.pass("State section");
        } else {
            result.fail("State section not applied");
        }

        if (is_close(cfg.state.rpm_threshold, 800.0)) {
            result.pass("Engine threshold shared with state reporting");
        } else {
            result.fail("Engine threshold not shared: " + std::to_string(cfg.state.rpm_threshold));
        }

        if (is_close(cfg.dispatcher.reset_max_hold_s, 4.0) && is_close(cfg.bindings.reload_cooldown_s, 2.0)) {
            result.pass("Dispatcher and controls sections");
        } else {
            result.fail("Dispatcher or controls section not applied");
        }

        if (is_close(cfg.dispatcher.stop_wait_timeout_s, 6.0)) {
            result.pass("Unset keys keep their defaults");
        } else {
            result.fail("Unset key lost its default");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Exception: ") + e.what());
    }

    std::remove(temp_yaml);
}

// Test 3: Missing file fallback
void test_missing_file(TestResult& result) {
    std::cout << "\n=== Test 3: Missing File Fallback ===\n";

    try {
        auto cfg = config::RigConfig::load("/tmp/nonexistent_rig_config_12345.yaml");
        if (cfg.device.id == config::RigConfig::get_default().device.id) {
            result.pass("Fell back to defaults");
        } else {
            result.fail("Did not fall back to defaults");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Missing file threw: ") + e.what());
    }
}

// Test 4: Validation
void test_validation(TestResult& result) {
    std::cout << "\n=== Test 4: Validation ===\n";

    const char* temp_yaml = "/tmp/test_rig_config_invalid.yaml";

    expect_rejected(result, temp_yaml,
                    "backend:\n  transport: websocket\n",
                    "backend.transport", "Unknown transport");
    expect_rejected(result, temp_yaml,
                    "state:\n  min_push_interval_s: 30\n  resync_interval_s: 30\n",
                    "resync_interval_s", "Resync not above push interval");
    expect_rejected(result, temp_yaml,
                    "logging:\n  level: chatty\n",
                    "logging.level", "Bad log level");
    expect_rejected(result, temp_yaml,
                    "telemetry:\n  poll_hz: 500\n",
                    "telemetry.poll_hz", "Poll rate out of range");
    expect_rejected(result, temp_yaml,
                    "commands:\n  always_allowed: enter_car\n",
                    "always_allowed", "Scalar always_allowed");
    expect_rejected(result, temp_yaml,
                    "device: [unclosed\n",
                    "YAML parse error", "Malformed YAML");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "RigConfig Unit Tests\n";
    std::cout << "========================================\n";

    TestResult result;

    test_default_config(result);
    test_valid_yaml(result);
    test_missing_file(result);
    test_validation(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
