/**
 * @file bike_data_broadcaster.cpp
 * @brief Periodic Indoor Bike Data notifier implementation
 * @version 1.0
 * @date 2026-09-22
 */

#include "pattern/bike_data_broadcaster.hpp"
#include "encoder/ftms_encoder.hpp"
#include "ftms/gatt_uuids.hpp"

#include <iostream>
#include <stdexcept>

namespace ftmsbridge {

    namespace {

        const BridgeConfig& validated(const BridgeConfig& config) {
            config.validate();
            return config;
        }

    } // namespace

    BikeDataBroadcaster::BikeDataBroadcaster(const BridgeConfig& config,
        const MetricStore& store,
        IBleTransport& transport)
        : interval_(validated(config).broadcast_interval_ms),
        profile_(config.output_profile),
        relay_heart_rate_(config.relay_heart_rate),
        store_(store),
        transport_(transport) {}

    BikeDataBroadcaster::~BikeDataBroadcaster() {
        try {
            stop();
        } catch (const std::exception& e) {
            std::cerr << "[Broadcaster] Error stopping in destructor: " << e.what() << std::endl;
        }
    }

    // === Lifecycle ===

    void BikeDataBroadcaster::start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            throw std::logic_error("Broadcaster is already running");
        }

        worker_ = std::thread(&BikeDataBroadcaster::run_loop, this);
        std::cout << "[Broadcaster] Started (" << interval_.count() << "ms)" << std::endl;
    }

    void BikeDataBroadcaster::stop() {
        {
            // Flip the flag under the wake mutex so the worker cannot miss the notify
            std::lock_guard<std::mutex> lock(wake_mutex_);
            if (!running_.load()) {
                return; // Already stopped
            }
            running_.store(false);
        }
        wake_cv_.notify_all();

        if (worker_.joinable()) {
            worker_.join();
        }
        std::cout << "[Broadcaster] Stopped" << std::endl;
    }

    // === Broadcast ===

    bool BikeDataBroadcaster::tick() {
        stats_.ticks.fetch_add(1, std::memory_order_relaxed);

        if (!transport_.has_subscribers(gatt::INDOOR_BIKE_DATA)) {
            stats_.skipped_ticks.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        auto snapshot = store_.snapshot();
        const auto data = encode_indoor_bike_data(FtmsOutputRecord::from_metrics(*snapshot),
                profile_);

        bool sent = transport_.notify(gatt::INDOOR_BIKE_DATA, data);
        if (sent) {
            stats_.notifications_sent.fetch_add(1, std::memory_order_relaxed);
        } else {
            stats_.send_errors.fetch_add(1, std::memory_order_relaxed);
        }

        if (relay_heart_rate_ && transport_.has_subscribers(gatt::HEART_RATE_MEASUREMENT)) {
            auto bpm = snapshot->get(Metric::HEART_RATE);
            if (bpm && *bpm > 0) {
                const auto hr = encode_heart_rate_measurement(*bpm);
                if (transport_.notify(gatt::HEART_RATE_MEASUREMENT, hr)) {
                    stats_.heart_rate_relays.fetch_add(1, std::memory_order_relaxed);
                } else {
                    stats_.send_errors.fetch_add(1, std::memory_order_relaxed);
                }
            }
        }
        return sent;
    }

    void BikeDataBroadcaster::run_loop() {
        auto next = std::chrono::steady_clock::now() + interval_;
        std::unique_lock<std::mutex> lock(wake_mutex_);

        while (running_.load()) {
            if (wake_cv_.wait_until(lock, next, [this] { return !running_.load(); })) {
                break;
            }
            lock.unlock();

            try {
                tick();
            } catch (const std::exception& e) {
                stats_.send_errors.fetch_add(1, std::memory_order_relaxed);
                std::cerr << "[Broadcaster] Tick error: " << e.what() << std::endl;
            }

            lock.lock();
            next += interval_;
            // Fell behind (slow transport): realign instead of bursting
            const auto now = std::chrono::steady_clock::now();
            if (next < now) {
                next = now + interval_;
            }
        }
    }

    // === Statistics ===

    BroadcastStatisticsSnapshot BikeDataBroadcaster::get_statistics() const {
        BroadcastStatisticsSnapshot snapshot;
        snapshot.ticks = stats_.ticks.load(std::memory_order_relaxed);
        snapshot.notifications_sent = stats_.notifications_sent.load(std::memory_order_relaxed);
        snapshot.skipped_ticks = stats_.skipped_ticks.load(std::memory_order_relaxed);
        snapshot.send_errors = stats_.send_errors.load(std::memory_order_relaxed);
        snapshot.heart_rate_relays = stats_.heart_rate_relays.load(std::memory_order_relaxed);
        return snapshot;
    }

    void BikeDataBroadcaster::reset_statistics() {
        stats_.reset();
    }

} // namespace ftmsbridge
