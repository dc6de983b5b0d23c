/**
 * @file ftms_encoder.cpp
 * @brief FTMS characteristic encoding
 * @version 1.0
 * @date 2026-09-18
 */

#include "encoder/ftms_encoder.hpp"
#include "codec/field_codec.hpp"

#include <algorithm>
#include <cmath>

namespace ftmsbridge {

    namespace {

        // Fitness Machine Features field bits
        constexpr std::uint32_t FEATURE_CADENCE = 1U << 1;
        constexpr std::uint32_t FEATURE_TOTAL_DISTANCE = 1U << 2;
        constexpr std::uint32_t FEATURE_EXPENDED_ENERGY = 1U << 9;
        constexpr std::uint32_t FEATURE_HEART_RATE = 1U << 10;
        constexpr std::uint32_t FEATURE_ELAPSED_TIME = 1U << 12;
        constexpr std::uint32_t FEATURE_POWER = 1U << 14;

        // Target Setting Features field bits
        constexpr std::uint32_t TARGET_RESISTANCE = 1U << 2;
        constexpr std::uint32_t TARGET_POWER = 1U << 3;

        /// Scale, round to the nearest integer and clamp into [lo, hi]
        std::int64_t quantize(double value, double scale, std::int64_t lo, std::int64_t hi) {
            const double scaled = value * scale;
            if (!std::isfinite(scaled)) {
                return scaled > 0 ? hi : lo;
            }
            const double clamped = std::clamp(scaled, static_cast<double>(lo),
                    static_cast<double>(hi));
            return static_cast<std::int64_t>(std::llround(clamped));
        }

        /// Sequential little-endian writer over a fixed-size buffer
        class FieldWriter {
            public:
                explicit FieldWriter(std::vector<std::uint8_t>& buffer) : buffer_(buffer) {}

                void put(FieldType type, std::int64_t value) {
                    FieldCodec::write(buffer_, offset_, type, Endian::LITTLE, value);
                    offset_ += field_width(type);
                }

                std::size_t offset() const { return offset_; }

            private:
                std::vector<std::uint8_t>& buffer_;
                std::size_t offset_ = 0;
        };

    } // namespace

    std::optional<OutputProfile> output_profile_from_string(const std::string& name) {
        if (name == "minimal") return OutputProfile::MINIMAL;
        if (name == "extended") return OutputProfile::EXTENDED;
        return std::nullopt;
    }

    FtmsOutputRecord FtmsOutputRecord::from_metrics(const MetricRecord& metrics) {
        FtmsOutputRecord out;
        out.power = metrics.get(Metric::POWER).value_or(0.0);
        out.cadence = metrics.get(Metric::CADENCE).value_or(0.0);
        out.speed = metrics.get(Metric::SPEED);
        out.heart_rate = metrics.get(Metric::HEART_RATE);
        if (auto km = metrics.get(Metric::DISTANCE)) {
            out.distance_m = *km * 1000.0;
        }
        out.calories = metrics.get(Metric::CALORIES);
        out.resistance = metrics.get(Metric::RESISTANCE);
        out.elapsed_time_s = metrics.get(Metric::DURATION);
        return out;
    }

    std::vector<std::uint8_t> encode_indoor_bike_data(const FtmsOutputRecord& record,
        OutputProfile profile) {
        const bool extended = profile == OutputProfile::EXTENDED;
        std::vector<std::uint8_t> buffer(extended ? INDOOR_BIKE_DATA_EXTENDED_SIZE
                                                  : INDOOR_BIKE_DATA_MINIMAL_SIZE);
        FieldWriter out(buffer);

        out.put(FieldType::UINT16, extended ? ibd_flags::EXTENDED : ibd_flags::MINIMAL);
        out.put(FieldType::UINT16, quantize(record.speed.value_or(0.0), 100.0, 0, 0xFFFF));
        out.put(FieldType::UINT16, quantize(record.cadence, 2.0, 0, 0xFFFF));

        if (extended) {
            out.put(FieldType::UINT24, quantize(record.distance_m.value_or(0.0), 1.0, 0,
                0xFFFFFF));
        }

        out.put(FieldType::INT16, quantize(record.power, 1.0, INT16_MIN, INT16_MAX));

        if (extended) {
            out.put(FieldType::UINT16, quantize(record.calories.value_or(0.0), 1.0, 0, 0xFFFF));
            out.put(FieldType::UINT16, 0);  // energy per hour
            out.put(FieldType::UINT8, 0);   // energy per minute
        }

        out.put(FieldType::UINT8, quantize(record.heart_rate.value_or(0.0), 1.0, 0, 0xFF));

        if (extended) {
            out.put(FieldType::UINT16, quantize(record.elapsed_time_s.value_or(0.0), 1.0, 0,
                0xFFFF));
        }
        return buffer;
    }

    std::array<std::uint8_t, 8> encode_fitness_machine_feature(OutputProfile profile,
        bool target_settings) {
        std::uint32_t features = FEATURE_CADENCE | FEATURE_HEART_RATE | FEATURE_POWER;
        if (profile == OutputProfile::EXTENDED) {
            features |= FEATURE_TOTAL_DISTANCE | FEATURE_EXPENDED_ENERGY | FEATURE_ELAPSED_TIME;
        }
        const std::uint32_t targets = target_settings ? (TARGET_RESISTANCE | TARGET_POWER) : 0;

        std::array<std::uint8_t, 8> buffer{};
        FieldCodec::write(buffer, 0, FieldType::UINT32, Endian::LITTLE, features);
        FieldCodec::write(buffer, 4, FieldType::UINT32, Endian::LITTLE, targets);
        return buffer;
    }

    std::array<std::uint8_t, 6> encode_supported_power_range(const PowerRange& range) {
        std::array<std::uint8_t, 6> buffer{};
        FieldCodec::write(buffer, 0, FieldType::UINT16, Endian::LITTLE, range.min);
        FieldCodec::write(buffer, 2, FieldType::UINT16, Endian::LITTLE, range.max);
        FieldCodec::write(buffer, 4, FieldType::UINT16, Endian::LITTLE, range.step);
        return buffer;
    }

    std::array<std::uint8_t, 6> encode_supported_resistance_range(const ResistanceRange& range) {
        std::array<std::uint8_t, 6> buffer{};
        FieldCodec::write(buffer, 0, FieldType::INT16, Endian::LITTLE, range.min);
        FieldCodec::write(buffer, 2, FieldType::INT16, Endian::LITTLE, range.max);
        FieldCodec::write(buffer, 4, FieldType::INT16, Endian::LITTLE, range.step);
        return buffer;
    }

    std::array<std::uint8_t, 2> encode_heart_rate_measurement(double bpm) {
        return {0x00, static_cast<std::uint8_t>(quantize(bpm, 1.0, 0, 0xFF))};
    }

} // namespace ftmsbridge
