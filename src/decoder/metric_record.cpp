/**
 * @file metric_record.cpp
 * @brief MetricRecord helpers and metric name table
 * @version 1.0
 * @date 2026-09-15
 */

#include "decoder/metric_record.hpp"

#include <sstream>

namespace ftmsbridge {

    namespace {
        constexpr std::array<const char*, METRIC_COUNT> METRIC_NAMES = {
            "power",
            "cadence",
            "heartRate",
            "speed",
            "distance",
            "resistance",
            "calories",
            "duration",
            "gear"
        };
    } // namespace

    const char* metric_name(Metric metric) {
        const auto idx = static_cast<std::size_t>(metric);
        return idx < METRIC_COUNT ? METRIC_NAMES[idx] : "unknown";
    }

    std::optional<Metric> metric_from_name(const std::string& name) {
        for (std::size_t i = 0; i < METRIC_COUNT; ++i) {
            if (name == METRIC_NAMES[i]) {
                return static_cast<Metric>(i);
            }
        }
        return std::nullopt;
    }

    bool MetricRecord::empty() const {
        return size() == 0;
    }

    std::size_t MetricRecord::size() const {
        std::size_t count = 0;
        for (const auto& value : values_) {
            if (value) ++count;
        }
        return count;
    }

    void MetricRecord::merge(const MetricRecord& newer) {
        for (std::size_t i = 0; i < METRIC_COUNT; ++i) {
            if (newer.values_[i]) {
                values_[i] = newer.values_[i];
            }
        }
        if (newer.source_type_) {
            source_type_ = newer.source_type_;
        }
    }

    std::string MetricRecord::to_string() const {
        std::ostringstream oss;
        bool first = true;
        for (std::size_t i = 0; i < METRIC_COUNT; ++i) {
            if (!values_[i]) continue;
            if (!first) oss << " ";
            oss << METRIC_NAMES[i] << "=" << *values_[i];
            first = false;
        }
        if (source_type_) {
            oss << (first ? "" : " ") << "[" << *source_type_ << "]";
        }
        return oss.str();
    }

} // namespace ftmsbridge
