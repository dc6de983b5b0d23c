/**
 * @file metric_record.hpp
 * @brief Normalized metric set produced by the decoder
 * @version 1.0
 * @date 2026-09-15
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ftmsbridge {

    /**
     * @brief Normalized metric names a device spec field may target
     *
     * Units: power W (signed), cadence RPM, heart rate BPM, speed km/h,
     * distance km, calories kcal, duration s. Resistance and gear are unitless levels.
     */
    enum class Metric : std::uint8_t {
        POWER = 0,
        CADENCE,
        HEART_RATE,
        SPEED,
        DISTANCE,
        RESISTANCE,
        CALORIES,
        DURATION,
        GEAR,
        COUNT_ ///< Number of metrics, not a metric
    };

    constexpr std::size_t METRIC_COUNT = static_cast<std::size_t>(Metric::COUNT_);

    /// JSON spelling of a metric ("power", "heartRate", ...)
    const char* metric_name(Metric metric);

    /// Inverse of metric_name(); std::nullopt for names that are not metrics
    std::optional<Metric> metric_from_name(const std::string& name);

    /**
     * @brief Normalized metric record
     *
     * A metric is present only when the source payload carried it. Absent
     * metrics are never defaulted to zero, so partial records from different
     * characteristics can be merged without clobbering each other.
     */
    class MetricRecord {
        public:
            bool has(Metric metric) const {
                return values_[index(metric)].has_value();
            }

            std::optional<double> get(Metric metric) const {
                return values_[index(metric)];
            }

            void set(Metric metric, double value) {
                values_[index(metric)] = value;
            }

            void clear(Metric metric) {
                values_[index(metric)].reset();
            }

            /// True when no metric is present (source_type is not considered)
            bool empty() const;

            /// Number of metrics present
            std::size_t size() const;

            const std::optional<std::string>& source_type() const { return source_type_; }
            void set_source_type(std::string id) { source_type_ = std::move(id); }

            /**
             * @brief Overwrite the metrics present in newer, keep the others
             *
             * source_type follows the newer record when it has one.
             */
            void merge(const MetricRecord& newer);

            /// Compact "power=150 cadence=85 [src]" rendering for logs
            std::string to_string() const;

            bool operator==(const MetricRecord& other) const {
                return values_ == other.values_ && source_type_ == other.source_type_;
            }

            bool operator!=(const MetricRecord& other) const {
                return !(*this == other);
            }

        private:
            static constexpr std::size_t index(Metric metric) {
                return static_cast<std::size_t>(metric);
            }

            std::array<std::optional<double>, METRIC_COUNT> values_{};
            std::optional<std::string> source_type_;
    };

} // namespace ftmsbridge
