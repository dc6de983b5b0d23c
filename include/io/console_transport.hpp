/**
 * @file console_transport.hpp
 * @brief IBleTransport that prints every outgoing value as hex
 * @version 1.0
 * @date 2026-09-20
 */

#pragma once

#include <iosfwd>
#include <mutex>

#include "ble_transport.hpp"

namespace ftmsbridge {

    /**
     * @brief Console sink used by the replay tool
     *
     * Output lines look like "notify 0x2ad2: 44 02 18 0b aa 00 96 00 78".
     * Every characteristic counts as subscribed.
     */
    class ConsoleTransport : public IBleTransport {
        public:
            explicit ConsoleTransport(std::ostream& out);

            bool notify(std::uint16_t characteristic,
                boost::span<const std::uint8_t> value) override;

            bool indicate(std::uint16_t characteristic,
                boost::span<const std::uint8_t> value) override;

            bool has_subscribers(std::uint16_t) const override { return true; }

            std::string get_name() const override { return "console"; }

        private:
            void print(const char* kind, std::uint16_t characteristic,
                boost::span<const std::uint8_t> value);

            std::ostream& out_;
            std::mutex mutex_;
    };

} // namespace ftmsbridge
