// src/service/rig_main.cpp
#include "bench/lua_rig_sim.hpp"
#include "config/rig_config.hpp"
#include "service/rig_service.hpp"
#include "utils/clock.hpp"
#include "utils/logging.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <getopt.h>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

} // namespace

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nRuns the rig command service against a Lua bench rig.\n");
    printf("\nOptions:\n");
    printf("  --config PATH         Service config YAML (default: config/rig_service.yaml)\n");
    printf("  --bench-script PATH   Lua bench rig script (default: from config)\n");
    printf("  --device-id ID        Device id (overrides config)\n");
    printf("  --api-url URL         Backend base URL (overrides config)\n");
    printf("  --log-level LEVEL     trace, debug, info, warn, error, off\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  %s --config config/rig_service.yaml\n\n", prog_name);
    printf("  %s --device-id rig-07 --api-url http://10.0.0.5:3000 --log-level debug\n\n", prog_name);
}

int main(int argc, char** argv) {
    std::string config_path = "config/rig_service.yaml";
    std::string bench_script;
    std::string device_id;
    std::string api_url;
    std::string log_level;

    // ========================================================================
    // Command-line parsing
    // ========================================================================
    static struct option long_options[] = {
        {"config",       required_argument, 0, 'c'},
        {"bench-script", required_argument, 0, 'b'},
        {"device-id",    required_argument, 0, 'd'},
        {"api-url",      required_argument, 0, 'u'},
        {"log-level",    required_argument, 0, 'l'},
        {"help",         no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'b':
                bench_script = optarg;
                break;
            case 'd':
                device_id = optarg;
                break;
            case 'u':
                api_url = optarg;
                break;
            case 'l': {
                utils::LogLevel lvl;
                if (!utils::parse_level(optarg, lvl)) {
                    fprintf(stderr, "Error: Invalid log level: %s\n", optarg);
                    return 1;
                }
                log_level = optarg;
                break;
            }
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    utils::set_level(utils::LogLevel::Info);

    // ========================================================================
    // Configuration: file, then command-line overrides
    // ========================================================================
    config::RigConfig cfg;
    try {
        cfg = config::RigConfig::load(config_path);
        if (!device_id.empty()) cfg.device.id = device_id;
        if (!api_url.empty()) cfg.backend.url = api_url;
        if (!log_level.empty()) cfg.logging.level = log_level;
        if (!bench_script.empty()) cfg.bench_lua_script = bench_script;
        cfg.validate();
    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }

    utils::LogLevel lvl = utils::LogLevel::Info;
    if (utils::parse_level(cfg.logging.level, lvl)) {
        utils::set_level(lvl);
    }
    if (!cfg.logging.file.empty()) {
        utils::open_log_file(cfg.logging.file);
    }

    cfg.print_summary();

    // ========================================================================
    // Bench rig and service
    // ========================================================================
    utils::SteadyClock rig_clock;
    bench::LuaRigSim rig(rig_clock);
    if (!rig.init(cfg.bench_lua_script)) {
        LOG_ERROR("Failed to init bench rig: %s", cfg.bench_lua_script.c_str());
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        service::RigService svc(cfg, rig, rig);
        svc.start();

        LOG_INFO("Rig commander running, Ctrl+C to stop");
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Shutting down");
        svc.stop();
    } catch (const std::exception& e) {
        LOG_ERROR("[Service] %s", e.what());
        utils::close_log_file();
        return 1;
    }

    utils::close_log_file();
    return 0;
}
