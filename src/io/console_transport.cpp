/**
 * @file console_transport.cpp
 * @brief Console transport implementation
 * @version 1.0
 * @date 2026-09-20
 */

#include "io/console_transport.hpp"
#include "spec/uuid.hpp"

#include <iomanip>
#include <ostream>

namespace ftmsbridge {

    ConsoleTransport::ConsoleTransport(std::ostream& out) : out_(out) {}

    bool ConsoleTransport::notify(std::uint16_t characteristic,
        boost::span<const std::uint8_t> value) {
        print("notify", characteristic, value);
        return true;
    }

    bool ConsoleTransport::indicate(std::uint16_t characteristic,
        boost::span<const std::uint8_t> value) {
        print("indicate", characteristic, value);
        return true;
    }

    void ConsoleTransport::print(const char* kind, std::uint16_t characteristic,
        boost::span<const std::uint8_t> value) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << kind << " " << format_short_uuid(characteristic) << ":";
        out_ << std::hex << std::setfill('0');
        for (auto byte : value) {
            out_ << " " << std::setw(2) << static_cast<int>(byte);
        }
        out_ << std::dec << std::setfill(' ') << std::endl;
    }

} // namespace ftmsbridge
