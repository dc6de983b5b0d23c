/**
 * @file bike_data_broadcaster.hpp
 * @brief Periodic Indoor Bike Data notifier
 * @version 1.0
 * @date 2026-09-22
 *
 * One worker thread wakes every broadcast interval, encodes the latest
 * MetricStore snapshot and notifies it on Indoor Bike Data (0x2AD2).
 * Optionally the heart rate is relayed on Heart Rate Measurement (0x2A37).
 *
 * @code{.cpp}
 * ┌──────────────────┐  snapshot()  ┌──────────────────────┐  notify()  ┌───────────────┐
 * │   MetricStore    │ ───────────> │ BikeDataBroadcaster  │ ─────────> │ IBleTransport │
 * └──────────────────┘              │  tick every 250 ms   │            └───────────────┘
 *                                   └──────────────────────┘
 * @endcode
 *
 * ## Thread Safety
 * - **running_** (atomic<bool>): controls the worker lifecycle
 * - **wake_cv_**: lets stop() interrupt the wait immediately
 * - **All statistics** (atomic<uint64_t>): lock-free counters
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "bridge_config.hpp"
#include "metric_store.hpp"
#include "../io/ble_transport.hpp"

namespace ftmsbridge {

    /**
     * @brief Broadcast counters
     *
     * All counters are atomic for thread-safe updates.
     * Use BikeDataBroadcaster::get_statistics() to get a non-atomic snapshot.
     */
    struct BroadcastStatistics {
        std::atomic<uint64_t> ticks{0};                ///< Ticks executed
        std::atomic<uint64_t> notifications_sent{0};   ///< Indoor Bike Data notifications sent
        std::atomic<uint64_t> skipped_ticks{0};        ///< Ticks with no subscriber
        std::atomic<uint64_t> send_errors{0};          ///< Notifications refused or thrown
        std::atomic<uint64_t> heart_rate_relays{0};    ///< Heart Rate Measurement notifications

        void reset() {
            ticks.store(0, std::memory_order_relaxed);
            notifications_sent.store(0, std::memory_order_relaxed);
            skipped_ticks.store(0, std::memory_order_relaxed);
            send_errors.store(0, std::memory_order_relaxed);
            heart_rate_relays.store(0, std::memory_order_relaxed);
        }
    };

    /**
     * @brief Non-atomic snapshot of broadcast statistics
     */
    struct BroadcastStatisticsSnapshot {
        uint64_t ticks;
        uint64_t notifications_sent;
        uint64_t skipped_ticks;
        uint64_t send_errors;
        uint64_t heart_rate_relays;

        std::string to_string() const {
            std::ostringstream oss;
            oss << "Broadcast Statistics:\n"
                << "  Ticks:         " << std::setw(10) << ticks << "\n"
                << "  Sent:          " << std::setw(10) << notifications_sent << "\n"
                << "  Skipped:       " << std::setw(10) << skipped_ticks << "\n"
                << "  Send Errors:   " << std::setw(10) << send_errors << "\n"
                << "  HR Relays:     " << std::setw(10) << heart_rate_relays;
            return oss.str();
        }
    };

    class BikeDataBroadcaster {
        public:
            /**
             * @param config Uses broadcast_interval_ms, output_profile and relay_heart_rate
             * @param store Snapshot source, must outlive the broadcaster
             * @param transport Output sink, must outlive the broadcaster
             * @throws std::invalid_argument if config is invalid
             */
            BikeDataBroadcaster(const BridgeConfig& config,
                const MetricStore& store,
                IBleTransport& transport);

            /**
             * @brief Destructor - stops the worker if running
             */
            ~BikeDataBroadcaster();

            BikeDataBroadcaster(const BikeDataBroadcaster&) = delete;
            BikeDataBroadcaster& operator=(const BikeDataBroadcaster&) = delete;

            /**
             * @brief Start the worker thread
             * @throws std::logic_error if already running
             */
            void start();

            /**
             * @brief Stop the worker thread
             * Wakes the worker immediately and blocks until it has joined.
             * Safe to call when not running.
             */
            void stop();

            bool is_running() const { return running_.load(std::memory_order_relaxed); }

            /**
             * @brief Run one broadcast cycle on the calling thread
             * @return bool True if Indoor Bike Data was notified
             */
            bool tick();

            std::chrono::milliseconds interval() const { return interval_; }

            BroadcastStatisticsSnapshot get_statistics() const;
            void reset_statistics();

        private:
            void run_loop();

            const std::chrono::milliseconds interval_;
            const OutputProfile profile_;
            const bool relay_heart_rate_;

            const MetricStore& store_;
            IBleTransport& transport_;

            BroadcastStatistics stats_;

            // === Threading ===
            std::atomic<bool> running_{false};
            std::thread worker_;
            std::mutex wake_mutex_;
            std::condition_variable wake_cv_;
    };

} // namespace ftmsbridge
