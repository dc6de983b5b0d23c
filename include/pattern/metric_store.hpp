/**
 * @file metric_store.hpp
 * @brief Latest merged metrics, shared between transport callbacks and the broadcaster
 * @version 1.0
 * @date 2026-09-20
 *
 * Writers merge partial records under an exclusive lock and publish a new
 * immutable snapshot. Readers take a shared lock only long enough to copy
 * the pointer, so a snapshot is never observed half-written.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>

#include "../decoder/metric_record.hpp"

namespace ftmsbridge {

    class MetricStore {
        public:
            MetricStore();

            /**
             * @brief Merge a decoded record into the current snapshot
             *
             * Metrics absent from the record keep their previous values.
             * Empty records (rejected payloads) are ignored.
             *
             * @return bool True if the snapshot changed
             */
            bool merge(const MetricRecord& record);

            /// Current snapshot, never null
            std::shared_ptr<const MetricRecord> snapshot() const;

            /// Drop all metrics
            void reset();

            /// Number of snapshots published since construction
            std::uint64_t version() const { return version_.load(std::memory_order_relaxed); }

        private:
            mutable std::shared_mutex mutex_;
            std::shared_ptr<const MetricRecord> current_;
            std::atomic<std::uint64_t> version_{0};
    };

} // namespace ftmsbridge
