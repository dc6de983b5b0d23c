/**
 * @file main.cpp
 * @brief ftmsbridge_replay: feed recorded BLE traffic through the bridge
 * @version 1.0
 * @date 2026-09-24
 *
 * Reads replay lines from stdin (see ReplayLine) and prints every
 * notification and indication the bridge sends.
 *
 * Example:
 *   printf '0x2a63 00 00 96 00\n0x2a37 00 47\nsleep 600\n' | ftmsbridge_replay
 */

#include "include/pattern/fitness_bridge.hpp"
#include "include/pattern/bridge_config.hpp"
#include "include/io/console_transport.hpp"
#include "include/exception/ftms_exception.hpp"
#include "scripts/script_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <getopt.h>

using namespace ftmsbridge;

void display_help(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] < replay.txt\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c <file>       JSON config file (default: none, env and defaults only)\n";
    std::cout << "  -s <dir>        Device spec directory (overrides config)\n";
    std::cout << "  -x              Use the extended Indoor Bike Data profile\n";
    std::cout << "  -h              Display this help message\n\n";
    std::cout << "Input lines:\n";
    std::cout << "  <characteristic> <hex>   e.g. 0x2a37 00 47\n";
    std::cout << "  cp <hex>                 control point write, e.g. cp 05 96 00\n";
    std::cout << "  sleep <ms>               let the broadcaster tick\n";
}

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    std::optional<std::string> spec_directory;
    bool extended = false;

    int opt;
    while ((opt = getopt(argc, argv, "c:s:xh")) != -1) {
        switch (opt) {
        case 'c':
            config_path = optarg;
            break;
        case 's':
            spec_directory = optarg;
            break;
        case 'x':
            extended = true;
            break;
        case 'h':
            display_help(argv[0]);
            return 0;
        default:
            display_help(argv[0]);
            return 1;
        }
    }

    try {
        BridgeConfig config = BridgeConfig::load(config_path);
        if (spec_directory) {
            config.spec_directory = *spec_directory;
        }
        if (extended) {
            config.output_profile = OutputProfile::EXTENDED;
        }
        config.validate();

        SpecRegistry registry = FitnessBridge::load_registry(config);
        ConsoleTransport transport(std::cout);
        FitnessBridge bridge(config, registry, transport);
        install_shutdown_handler();

        const auto feature = bridge.fitness_machine_feature();
        std::cout << "[Replay] Fitness Machine Feature: "
                  << format_hex(std::vector<std::uint8_t>(feature.begin(), feature.end())) << std::endl;

        {
            // The broadcaster thread inherits the blocked mask
            ScopedShutdownSignalBlock block;
            bridge.start();
        }

        std::string line;
        std::size_t line_number = 0;
        while (!shutdown_requested() && std::getline(std::cin, line)) {
            ++line_number;
            ReplayLine parsed;
            try {
                parsed = parse_replay_line(line);
            } catch (const std::exception& e) {
                std::cerr << "[Replay] Line " << line_number << " skipped: " << e.what()
                          << std::endl;
                continue;
            }

            switch (parsed.kind) {
            case ReplayLine::Kind::EMPTY:
                break;
            case ReplayLine::Kind::SLEEP:
                std::this_thread::sleep_for(std::chrono::milliseconds(parsed.sleep_ms));
                break;
            case ReplayLine::Kind::CONTROL_POINT: {
                auto result = bridge.on_control_point_write(parsed.data);
                if (!result) {
                    std::cerr << "[Replay] Control point: " << result.describe() << std::endl;
                }
                break;
            }
            case ReplayLine::Kind::VALUE: {
                auto record = bridge.on_characteristic_value(parsed.characteristic, parsed.data);
                std::cout << "[" << get_timestamp() << "] " << parsed.characteristic << " -> "
                          << (record.empty() ? "(ignored)" : record.to_string()) << std::endl;
                break;
            }
            }
        }

        if (shutdown_requested()) {
            std::cout << "\n[SIGNAL] Shutdown requested - stopping...\n";
        } else {
            // One more broadcast with the final state before shutting down
            std::this_thread::sleep_for(bridge.broadcaster().interval());
        }
        bridge.stop();

        std::cout << "\n" << bridge.get_statistics().to_string() << "\n";
        std::cout << bridge.broadcaster().get_statistics().to_string() << "\n";
        return 0;
    } catch (const ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
