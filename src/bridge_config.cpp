/**
 * @file bridge_config.cpp
 * @brief Configuration structure implementation
 * @version 2.0
 * @date 2026-09-21
 */

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "pattern/bridge_config.hpp"
#include "exception/ftms_exception.hpp"

using json = nlohmann::json;

namespace ftmsbridge {

    namespace {

        const char* const ENV_KEYS[] = {
            "FTMSBRIDGE_SPEC_DIRECTORY",
            "FTMSBRIDGE_BROADCAST_INTERVAL_MS",
            "FTMSBRIDGE_OUTPUT_PROFILE",
            "FTMSBRIDGE_ENFORCE_CONTROL",
            "FTMSBRIDGE_ALLOW_DUPLICATE_CHARACTERISTICS",
            "FTMSBRIDGE_RELAY_HEART_RATE",
            "FTMSBRIDGE_ADVERTISE_TARGET_SETTINGS",
            "FTMSBRIDGE_POWER_RANGE",
            "FTMSBRIDGE_RESISTANCE_RANGE",
        };

        std::string to_lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(), ::tolower);
            return value;
        }

        std::string to_upper_key(std::string key) {
            std::transform(key.begin(), key.end(), key.begin(), ::toupper);
            return key;
        }

        bool parse_bool(const std::string& key, const std::string& value) {
            const std::string v = to_lower(value);
            if (v == "true" || v == "1" || v == "yes") return true;
            if (v == "false" || v == "0" || v == "no") return false;
            throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
        }

        long parse_long(const std::string& key, const std::string& value) {
            try {
                std::size_t used = 0;
                long result = std::stol(value, &used, 0);  // Support hex (0x...)
                if (used != value.size()) {
                    throw std::invalid_argument(value);
                }
                return result;
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid number for " + key + ": " + value);
            }
        }

        /// "min,max,step" -> three integers
        std::vector<long> parse_triplet(const std::string& key, const std::string& value) {
            std::vector<long> parts;
            std::stringstream ss(value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                parts.push_back(parse_long(key, item));
            }
            if (parts.size() != 3) {
                throw std::invalid_argument("Expected min,max,step for " + key + ": " + value);
            }
            return parts;
        }

        std::string range_to_string(const json& range) {
            return std::to_string(range.at("min").get<long>()) + "," +
                   std::to_string(range.at("max").get<long>()) + "," +
                   std::to_string(range.value("step", 1L));
        }

    } // namespace

    // === Configuration Validation ===

    void BridgeConfig::validate() const {
        if (spec_directory.empty()) {
            throw std::invalid_argument("Device spec directory cannot be empty");
        }

        if (broadcast_interval_ms < 10) {
            throw std::invalid_argument("Broadcast interval too small (min 10ms)");
        }
        if (broadcast_interval_ms > 10000) {
            throw std::invalid_argument("Broadcast interval too large (max 10000ms)");
        }

        if (power_range.min > power_range.max) {
            throw std::invalid_argument("Power range min exceeds max");
        }
        if (power_range.step == 0) {
            throw std::invalid_argument("Power range step must be > 0");
        }
        if (resistance_range.min > resistance_range.max) {
            throw std::invalid_argument("Resistance range min exceeds max");
        }
        if (resistance_range.step <= 0) {
            throw std::invalid_argument("Resistance range step must be > 0");
        }
    }

    // === Factory Methods ===

    BridgeConfig BridgeConfig::create_default() {
        return BridgeConfig{};
    }

    // === JSON File Parsing ===

    BridgeConfig BridgeConfig::from_json(const json& j) {
        BridgeConfig config = create_default();

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (j.contains("bridge_config")) {
            const auto& bc = j["bridge_config"];

            try {
                if (bc.contains("spec_directory")) {
                    config_map["FTMSBRIDGE_SPEC_DIRECTORY"] = bc["spec_directory"].get<std::string>();
                }
                if (bc.contains("broadcast_interval_ms")) {
                    config_map["FTMSBRIDGE_BROADCAST_INTERVAL_MS"] =
                        std::to_string(bc["broadcast_interval_ms"].get<long>());
                }
                if (bc.contains("output_profile")) {
                    config_map["FTMSBRIDGE_OUTPUT_PROFILE"] = bc["output_profile"].get<std::string>();
                }
                for (const char* key : {"enforce_control", "allow_duplicate_characteristics",
                                        "relay_heart_rate", "advertise_target_settings"}) {
                    if (bc.contains(key)) {
                        config_map["FTMSBRIDGE_" + to_upper_key(key)] =
                            bc[key].get<bool>() ? "true" : "false";
                    }
                }
                if (bc.contains("power_range")) {
                    config_map["FTMSBRIDGE_POWER_RANGE"] = range_to_string(bc["power_range"]);
                }
                if (bc.contains("resistance_range")) {
                    config_map["FTMSBRIDGE_RESISTANCE_RANGE"] =
                        range_to_string(bc["resistance_range"]);
                }
            } catch (const json::exception& e) {
                throw std::invalid_argument(std::string("Malformed bridge_config: ") + e.what());
            }
        }

        // Reuse existing parsing logic
        apply_config_map(config, config_map);

        return config;
    }

    // === Configuration Application ===

    void BridgeConfig::apply_config_map(BridgeConfig& config,
        const std::map<std::string, std::string>& vars) {
        // Helper to get value with key
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val("FTMSBRIDGE_SPEC_DIRECTORY")) {
            config.spec_directory = *val;
        }

        if (auto val = get_val("FTMSBRIDGE_BROADCAST_INTERVAL_MS")) {
            long ms = parse_long("FTMSBRIDGE_BROADCAST_INTERVAL_MS", *val);
            if (ms <= 0) {
                throw std::invalid_argument("Broadcast interval must be > 0: " + *val);
            }
            config.broadcast_interval_ms = static_cast<std::uint32_t>(ms);
        }

        if (auto val = get_val("FTMSBRIDGE_OUTPUT_PROFILE")) {
            auto profile = output_profile_from_string(to_lower(*val));
            if (!profile) {
                throw std::invalid_argument("Invalid output profile: " + *val);
            }
            config.output_profile = *profile;
        }

        if (auto val = get_val("FTMSBRIDGE_ENFORCE_CONTROL")) {
            config.enforce_control = parse_bool("FTMSBRIDGE_ENFORCE_CONTROL", *val);
        }
        if (auto val = get_val("FTMSBRIDGE_ALLOW_DUPLICATE_CHARACTERISTICS")) {
            config.allow_duplicate_characteristics =
                parse_bool("FTMSBRIDGE_ALLOW_DUPLICATE_CHARACTERISTICS", *val);
        }
        if (auto val = get_val("FTMSBRIDGE_RELAY_HEART_RATE")) {
            config.relay_heart_rate = parse_bool("FTMSBRIDGE_RELAY_HEART_RATE", *val);
        }
        if (auto val = get_val("FTMSBRIDGE_ADVERTISE_TARGET_SETTINGS")) {
            config.advertise_target_settings =
                parse_bool("FTMSBRIDGE_ADVERTISE_TARGET_SETTINGS", *val);
        }

        // Ranges go through the wire types: power is uint16, resistance sint16
        if (auto val = get_val("FTMSBRIDGE_POWER_RANGE")) {
            auto parts = parse_triplet("FTMSBRIDGE_POWER_RANGE", *val);
            for (long part : parts) {
                if (part < 0 || part > 0xFFFF) {
                    throw std::invalid_argument("Power range value out of uint16: " + *val);
                }
            }
            config.power_range = {static_cast<std::uint16_t>(parts[0]),
                                  static_cast<std::uint16_t>(parts[1]),
                                  static_cast<std::uint16_t>(parts[2])};
        }
        if (auto val = get_val("FTMSBRIDGE_RESISTANCE_RANGE")) {
            auto parts = parse_triplet("FTMSBRIDGE_RESISTANCE_RANGE", *val);
            for (long part : parts) {
                if (part < INT16_MIN || part > INT16_MAX) {
                    throw std::invalid_argument("Resistance range value out of int16: " + *val);
                }
            }
            config.resistance_range = {static_cast<std::int16_t>(parts[0]),
                                       static_cast<std::int16_t>(parts[1]),
                                       static_cast<std::int16_t>(parts[2])};
        }
    }

    // === Load Methods ===

    BridgeConfig BridgeConfig::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw ConfigException(Status::DNOT_FOUND, "Cannot open JSON config file: " + filepath);
        }

        json j;
        try {
            file >> j;
        } catch (const json::exception& e) {
            throw ConfigException(Status::DCONFIG_ERROR,
                      "JSON parse error in " + filepath + ": " + e.what());
        }
        return from_json(j);
    }

    BridgeConfig BridgeConfig::load(const std::optional<std::string>& config_file_path) {
        // Start with defaults
        BridgeConfig config = create_default();

        // Apply JSON config file if provided
        if (config_file_path.has_value()) {
            config = from_file(*config_file_path);
        }

        // Apply environment variables (highest priority)
        std::map<std::string, std::string> env_vars;
        for (const char* key : ENV_KEYS) {
            if (const char* val = std::getenv(key)) {
                env_vars[key] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace ftmsbridge
