/**
 * @file metric_store.cpp
 * @brief Metric store implementation
 * @version 1.0
 * @date 2026-09-20
 */

#include "pattern/metric_store.hpp"

#include <mutex>

namespace ftmsbridge {

    MetricStore::MetricStore() : current_(std::make_shared<const MetricRecord>()) {}

    bool MetricStore::merge(const MetricRecord& record) {
        if (record.empty()) {
            return false;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto next = std::make_shared<MetricRecord>(*current_);
        next->merge(record);
        if (*next == *current_) {
            return false;
        }
        current_ = std::move(next);
        version_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    std::shared_ptr<const MetricRecord> MetricStore::snapshot() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return current_;
    }

    void MetricStore::reset() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        current_ = std::make_shared<const MetricRecord>();
        version_.fetch_add(1, std::memory_order_relaxed);
    }

} // namespace ftmsbridge
