/**
 * @file gatt_uuids.hpp
 * @brief Assigned 16-bit GATT UUIDs used by the bridge
 * @version 1.0
 * @date 2026-09-18
 */

#pragma once

#include <cstdint>

namespace ftmsbridge {
    namespace gatt {

        // === Services ===
        constexpr std::uint16_t FITNESS_MACHINE_SERVICE = 0x1826;
        constexpr std::uint16_t CYCLING_POWER_SERVICE = 0x1818;
        constexpr std::uint16_t CYCLING_SPEED_CADENCE_SERVICE = 0x1816;
        constexpr std::uint16_t HEART_RATE_SERVICE = 0x180D;

        // === Fitness Machine characteristics ===
        constexpr std::uint16_t INDOOR_BIKE_DATA = 0x2AD2;
        constexpr std::uint16_t FITNESS_MACHINE_FEATURE = 0x2ACC;
        constexpr std::uint16_t FITNESS_MACHINE_CONTROL_POINT = 0x2AD9;
        constexpr std::uint16_t FITNESS_MACHINE_STATUS = 0x2ADA;
        constexpr std::uint16_t SUPPORTED_POWER_RANGE = 0x2AD8;
        constexpr std::uint16_t SUPPORTED_RESISTANCE_RANGE = 0x2AD6;

        // === Other standard characteristics ===
        constexpr std::uint16_t CYCLING_POWER_MEASUREMENT = 0x2A63;
        constexpr std::uint16_t HEART_RATE_MEASUREMENT = 0x2A37;

    } // namespace gatt
} // namespace ftmsbridge
