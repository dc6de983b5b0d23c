/**
 * @file ftms_encoder.hpp
 * @brief Builds FTMS characteristic buffers from normalized metrics
 * @version 1.0
 * @date 2026-09-18
 *
 * Indoor Bike Data layouts (little-endian):
 *
 * MINIMAL, 9 bytes, flags 0x0244
 * | Offset | Size | Field        | Unit      |
 * |--------|------|--------------|-----------|
 * | 0      | 2    | flags        |           |
 * | 2      | 2    | speed        | 0.01 km/h |
 * | 4      | 2    | cadence      | 0.5 RPM   |
 * | 6      | 2    | power (s16)  | W         |
 * | 8      | 1    | heart rate   | BPM       |
 *
 * EXTENDED, 19 bytes, flags 0x0B54: speed, cadence, distance (u24 m), power,
 * energy (total u16 kcal, per hour u16, per minute u8), heart rate, elapsed (u16 s).
 *
 * Bit 0 ("more data") is always clear, which in FTMS means speed is present.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../decoder/metric_record.hpp"

namespace ftmsbridge {

    enum class OutputProfile : std::uint8_t {
        MINIMAL,
        EXTENDED
    };

    /// "minimal" / "extended", std::nullopt otherwise
    std::optional<OutputProfile> output_profile_from_string(const std::string& name);

    // === Indoor Bike Data flag bits ===
    namespace ibd_flags {
        constexpr std::uint16_t MORE_DATA = 1U << 0;
        constexpr std::uint16_t INSTANTANEOUS_CADENCE = 1U << 2;
        constexpr std::uint16_t TOTAL_DISTANCE = 1U << 4;
        constexpr std::uint16_t INSTANTANEOUS_POWER = 1U << 6;
        constexpr std::uint16_t EXPENDED_ENERGY = 1U << 8;
        constexpr std::uint16_t HEART_RATE = 1U << 9;
        constexpr std::uint16_t ELAPSED_TIME = 1U << 11;

        constexpr std::uint16_t MINIMAL = INSTANTANEOUS_CADENCE | INSTANTANEOUS_POWER |
            HEART_RATE;
        constexpr std::uint16_t EXTENDED = MINIMAL | TOTAL_DISTANCE | EXPENDED_ENERGY |
            ELAPSED_TIME;
    }

    constexpr std::size_t INDOOR_BIKE_DATA_MINIMAL_SIZE = 9;
    constexpr std::size_t INDOOR_BIKE_DATA_EXTENDED_SIZE = 19;

    /**
     * @brief Values carried by one Indoor Bike Data notification
     *
     * power and cadence are always sent (0 when unknown). The optional fields
     * are sent as 0 when absent but their flag bits stay set, so the flags
     * always describe the payload that follows.
     */
    struct FtmsOutputRecord {
        double power = 0.0;
        double cadence = 0.0;
        std::optional<double> speed;            ///< km/h
        std::optional<double> heart_rate;       ///< BPM
        std::optional<double> distance_m;       ///< meters
        std::optional<double> calories;         ///< kcal
        std::optional<double> resistance;     ///< Carried for callers, not encoded
        std::optional<double> elapsed_time_s;

        /// Distance km -> m, duration -> elapsed time
        static FtmsOutputRecord from_metrics(const MetricRecord& metrics);
    };

    struct PowerRange {
        std::uint16_t min = 0;
        std::uint16_t max = 2000;
        std::uint16_t step = 1;
    };

    struct ResistanceRange {
        std::int16_t min = 0;
        std::int16_t max = 100;
        std::int16_t step = 1;
    };

    /**
     * @brief Encode Indoor Bike Data (0x2AD2)
     *
     * Values are rounded to the field resolution and clamped to the field range.
     */
    std::vector<std::uint8_t> encode_indoor_bike_data(const FtmsOutputRecord& record,
        OutputProfile profile = OutputProfile::MINIMAL);

    /**
     * @brief Encode Fitness Machine Feature (0x2ACC): features u32 + target settings u32
     * @param target_settings Advertise resistance (bit 2) and power (bit 3) targets
     */
    std::array<std::uint8_t, 8> encode_fitness_machine_feature(OutputProfile profile,
        bool target_settings);

    /// Supported Power Range (0x2AD8): min, max, step as uint16
    std::array<std::uint8_t, 6> encode_supported_power_range(const PowerRange& range);

    /// Supported Resistance Range (0x2AD6): min, max, step as sint16
    std::array<std::uint8_t, 6> encode_supported_resistance_range(const ResistanceRange& range);

    /// Heart Rate Measurement (0x2A37) with 8-bit value format: {0x00, bpm}
    std::array<std::uint8_t, 2> encode_heart_rate_measurement(double bpm);

} // namespace ftmsbridge
