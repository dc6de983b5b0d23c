/**
 * @file ble_transport.hpp
 * @brief Abstract interface for the outbound side of the BLE GATT server
 * @version 1.0
 * @date 2026-09-20
 *
 * Platform BLE bindings (advertising, GATT server, client subscriptions) live
 * outside the library. The bridge only needs to push bytes out on a
 * characteristic, so that is all this interface covers.
 */

#pragma once

#include <cstdint>
#include <string>
#include <boost/core/span.hpp>

namespace ftmsbridge {

    /**
     * @brief Abstract interface for BLE notify/indicate output
     *
     * Implementations:
     * - ConsoleTransport: hex dump to an ostream, used by the replay tool
     * - MockBleTransport: records traffic for tests
     */
    class IBleTransport {
        public:
            virtual ~IBleTransport() = default;

            /**
             * @brief Send a notification on a characteristic
             * @param characteristic 16-bit assigned characteristic UUID
             * @param value Characteristic value
             * @return bool True if the value was handed to the stack
             */
            virtual bool notify(std::uint16_t characteristic,
                boost::span<const std::uint8_t> value) = 0;

            /**
             * @brief Send an indication (acknowledged notification) on a characteristic
             * @return bool True if the value was handed to the stack
             */
            virtual bool indicate(std::uint16_t characteristic,
                boost::span<const std::uint8_t> value) = 0;

            /**
             * @brief Check whether any client subscribed to a characteristic
             */
            virtual bool has_subscribers(std::uint16_t characteristic) const = 0;

            /**
             * @brief Get a name for logging (e.g. "console")
             */
            virtual std::string get_name() const = 0;
    };

} // namespace ftmsbridge
