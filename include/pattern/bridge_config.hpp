/**
 * @file bridge_config.hpp
 * @brief Configuration structure for the FTMS bridge
 * @version 2.0
 * @date 2026-09-21
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (config/bridge_config.json) - Recommended
 * 2. Environment variables (FTMSBRIDGE_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <map>

#include <nlohmann/json.hpp>

#include "../encoder/ftms_encoder.hpp"

namespace ftmsbridge {

    /**
     * @brief Configuration for the FTMS bridge
     *
     * Environment Variables:
     *
     * - FTMSBRIDGE_SPEC_DIRECTORY: Device spec directory (default: "device-specs")
     *
     * - FTMSBRIDGE_BROADCAST_INTERVAL_MS: Indoor Bike Data period in ms (default: 250)
     *
     * - FTMSBRIDGE_OUTPUT_PROFILE: minimal/extended (default: minimal)
     *
     * - FTMSBRIDGE_ENFORCE_CONTROL: Require Request Control first (true/false, default: false)
     *
     * - FTMSBRIDGE_ALLOW_DUPLICATE_CHARACTERISTICS: Last spec wins on duplicate
     *   characteristic UUIDs (true/false, default: false)
     *
     * - FTMSBRIDGE_RELAY_HEART_RATE: Also notify Heart Rate Measurement (default: false)
     *
     * - FTMSBRIDGE_ADVERTISE_TARGET_SETTINGS: Advertise power/resistance targets (default: false)
     *
     * - FTMSBRIDGE_POWER_RANGE: "min,max,step" in W (default: "0,2000,1")
     *
     * - FTMSBRIDGE_RESISTANCE_RANGE: "min,max,step" (default: "0,100,1")
     */
    struct BridgeConfig {
        // === Device Specs ===
        std::string spec_directory = "device-specs";
        bool allow_duplicate_characteristics = false;

        // === Output ===
        std::uint32_t broadcast_interval_ms = 250;
        OutputProfile output_profile = OutputProfile::MINIMAL;
        bool relay_heart_rate = false;

        // === Control Point ===
        bool enforce_control = false;
        bool advertise_target_settings = false;
        PowerRange power_range;
        ResistanceRange resistance_range;

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        /**
         * @brief Create default configuration
         * @return BridgeConfig with sensible defaults
         */
        static BridgeConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file (e.g., bridge_config.json)
         * @return BridgeConfig loaded from JSON file
         * @throws ConfigException (DNOT_FOUND) if file cannot be read
         * @throws ConfigException (DCONFIG_ERROR) if it cannot be parsed
         */
        static BridgeConfig from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing bridge_config
         * @return BridgeConfig loaded from JSON
         * @throws std::invalid_argument if a value is malformed
         */
        static BridgeConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         * @return BridgeConfig with merged settings
         */
        static BridgeConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        private:
            /**
             * @brief Apply configuration from key-value map
             * @param config Configuration to update
             * @param vars Key-value pairs
             */
            static void apply_config_map(BridgeConfig& config,
                const std::map<std::string, std::string>& vars);
    };

} // namespace ftmsbridge
