/**
 * @file fitness_bridge.hpp
 * @brief Facade translating inbound fitness BLE data into an FTMS Indoor Bike
 * @version 1.0
 * @date 2026-09-23
 *
 * Inbound: the platform transport pushes every characteristic value it
 * receives from a connected peripheral into on_characteristic_value(), and
 * every client write to the FTMS control point into on_control_point_write().
 *
 * Outbound: the broadcaster notifies Indoor Bike Data through the injected
 * IBleTransport; control point responses go out as indications.
 *
 * @code{.cpp}
 * auto config = BridgeConfig::load("config/bridge_config.json");
 * auto registry = FitnessBridge::load_registry(config);
 * ConsoleTransport transport(std::cout);
 * FitnessBridge bridge(config, registry, transport);
 * bridge.start();
 * bridge.on_characteristic_value("0x2a63", payload);
 * @endcode
 */

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <boost/core/span.hpp>

#include "bike_data_broadcaster.hpp"
#include "bridge_config.hpp"
#include "metric_store.hpp"
#include "../decoder/spec_decoder.hpp"
#include "../ftms/control_point.hpp"
#include "../io/ble_transport.hpp"
#include "../spec/spec_registry.hpp"

namespace ftmsbridge {

    /**
     * @brief Inbound traffic counters, atomic for updates from transport callbacks
     */
    struct BridgeStatistics {
        std::atomic<uint64_t> values_received{0};         ///< Characteristic values pushed in
        std::atomic<uint64_t> values_decoded{0};          ///< Values that produced metrics
        std::atomic<uint64_t> values_rejected{0};         ///< Values a spec refused
        std::atomic<uint64_t> unknown_characteristics{0}; ///< Values with no matching spec
        std::atomic<uint64_t> control_writes{0};          ///< Control point writes handled

        void reset() {
            values_received.store(0, std::memory_order_relaxed);
            values_decoded.store(0, std::memory_order_relaxed);
            values_rejected.store(0, std::memory_order_relaxed);
            unknown_characteristics.store(0, std::memory_order_relaxed);
            control_writes.store(0, std::memory_order_relaxed);
        }
    };

    struct BridgeStatisticsSnapshot {
        uint64_t values_received;
        uint64_t values_decoded;
        uint64_t values_rejected;
        uint64_t unknown_characteristics;
        uint64_t control_writes;

        std::string to_string() const {
            std::ostringstream oss;
            oss << "Bridge Statistics:\n"
                << "  Received:      " << std::setw(10) << values_received << "\n"
                << "  Decoded:       " << std::setw(10) << values_decoded << "\n"
                << "  Rejected:      " << std::setw(10) << values_rejected << "\n"
                << "  Unknown Char:  " << std::setw(10) << unknown_characteristics << "\n"
                << "  Control Writes:" << std::setw(10) << control_writes;
            return oss.str();
        }
    };

    class FitnessBridge {
        public:
            /**
             * @brief Constructor with dependency injection
             * @param config Bridge configuration
             * @param registry Loaded spec registry, must outlive the bridge
             * @param transport Output sink (console, platform binding or mock)
             * @throws std::invalid_argument if config is invalid
             */
            FitnessBridge(const BridgeConfig& config,
                const SpecRegistry& registry,
                IBleTransport& transport);

            ~FitnessBridge();

            FitnessBridge(const FitnessBridge&) = delete;
            FitnessBridge& operator=(const FitnessBridge&) = delete;

            /**
             * @brief Build a registry from config.spec_directory
             *
             * allow_duplicate_characteristics selects DuplicatePolicy::LAST_WINS.
             *
             * @throws ConfigException on any spec loading error
             */
            static SpecRegistry load_registry(const BridgeConfig& config);

            // === Inbound ===

            /**
             * @brief Handle a value received on a subscribed characteristic
             * @param characteristic UUID in any spelling normalize_uuid() accepts
             * @param value Raw characteristic value
             * @return MetricRecord What was decoded (empty when rejected or unknown)
             */
            MetricRecord on_characteristic_value(const std::string& characteristic,
                boost::span<const std::uint8_t> value);

            /**
             * @brief Handle a client write to the FTMS control point
             *
             * The response is indicated on the control point when a client
             * subscribed to it.
             *
             * @return The response, or WBAD_LENGTH for an empty write
             */
            Result<ControlPointResponse> on_control_point_write(
                boost::span<const std::uint8_t> request);

            // === Lifecycle ===

            /**
             * @brief Start broadcasting Indoor Bike Data
             * @throws std::logic_error if already running
             */
            void start();

            /// Stop broadcasting, idempotent
            void stop();

            bool is_running() const { return broadcaster_.is_running(); }

            // === Readable characteristic values ===
            std::array<std::uint8_t, 8> fitness_machine_feature() const;
            std::array<std::uint8_t, 6> supported_power_range() const;
            std::array<std::uint8_t, 6> supported_resistance_range() const;

            /// Characteristics the transport must subscribe to on the peripheral side
            std::vector<Subscription> subscriptions() const {
                return registry_.subscription_list();
            }

            // === Accessors ===
            const BridgeConfig& get_config() const { return config_; }
            const MetricStore& store() const { return store_; }
            const ControlPoint& control_point() const { return control_point_; }
            BikeDataBroadcaster& broadcaster() { return broadcaster_; }

            BridgeStatisticsSnapshot get_statistics() const;
            void reset_statistics();

        private:
            BridgeConfig config_;
            const SpecRegistry& registry_;
            IBleTransport& transport_;

            MetricStore store_;
            ControlPoint control_point_;
            BikeDataBroadcaster broadcaster_;

            BridgeStatistics stats_;
    };

} // namespace ftmsbridge
