/**
 * @file script_utils.hpp
 * @brief Shared utilities for the ftmsbridge command-line tools
 * @version 0.2
 * @date 2026-09-24
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <signal.h>

namespace ftmsbridge {

// === Common Utility Functions ===

/**
 * @brief Format bytes as hex string
 * @return std::string Formatted hex string (e.g., "44 02 18 0B")
 */
    inline std::string format_hex(const std::vector<std::uint8_t>& data) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (std::size_t i = 0; i < data.size(); ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
            if (i + 1 < data.size()) oss << " ";
        }
        return oss.str();
    }

/**
 * @brief Get current timestamp as formatted string
 * @return std::string Timestamp in format "HH:MM:SS.mmm"
 */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto timer = std::chrono::system_clock::to_time_t(now);
        std::tm bt = *std::localtime(&timer);

        std::ostringstream oss;
        oss << std::put_time(&bt, "%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

/**
 * @brief Parse hex string to binary data
 * @param hex_str Hex string (e.g., "DEADBEEF" or "DE AD BE EF")
 * @return std::vector<std::uint8_t> Binary data
 * @throws std::invalid_argument if string contains invalid hex characters
 */
    inline std::vector<std::uint8_t> parse_hex_data(const std::string& hex_str) {
        std::vector<std::uint8_t> data;
        std::string clean_str;

        // Remove separators
        for (char c : hex_str) {
            if (std::isxdigit(static_cast<unsigned char>(c))) {
                clean_str += c;
            } else if (c != ' ' && c != ':' && c != '-' && c != '\t') {
                throw std::invalid_argument("Invalid hex character in data string: " + hex_str);
            }
        }

        // Must have even number of hex digits
        if (clean_str.size() % 2 != 0) {
            throw std::invalid_argument("Hex data string must have even number of digits");
        }

        for (std::size_t i = 0; i < clean_str.size(); i += 2) {
            data.push_back(static_cast<std::uint8_t>(std::stoul(clean_str.substr(i, 2), nullptr,
                16)));
        }
        return data;
    }

// === Replay Input ===

/**
 * @brief One line of replay input
 *
 * Accepted forms:
 * - "<characteristic> <hex>"  value received from a peripheral
 * - "cp <hex>"                client write to the control point
 * - "sleep <ms>"              pause the replay
 * Blank lines and lines starting with '#' are skipped (kind EMPTY).
 */
    struct ReplayLine {
        enum class Kind { EMPTY, VALUE, CONTROL_POINT, SLEEP };

        Kind kind = Kind::EMPTY;
        std::string characteristic;
        std::vector<std::uint8_t> data;
        std::uint32_t sleep_ms = 0;
    };

/**
 * @throws std::invalid_argument on malformed lines
 */
    inline ReplayLine parse_replay_line(const std::string& line) {
        ReplayLine parsed;
        std::istringstream iss(line);
        std::string head;
        if (!(iss >> head) || head[0] == '#') {
            return parsed;
        }

        std::string rest;
        std::getline(iss, rest);

        if (head == "sleep") {
            parsed.kind = ReplayLine::Kind::SLEEP;
            parsed.sleep_ms = static_cast<std::uint32_t>(std::stoul(rest));
        } else if (head == "cp") {
            parsed.kind = ReplayLine::Kind::CONTROL_POINT;
            parsed.data = parse_hex_data(rest);
        } else {
            parsed.kind = ReplayLine::Kind::VALUE;
            parsed.characteristic = head;
            parsed.data = parse_hex_data(rest);
        }
        return parsed;
    }

// === Shutdown Signals ===

    // Set by the SIGINT/SIGTERM handler, polled by the tool's main loop
    inline volatile std::sig_atomic_t g_shutdown_requested = 0;

    inline void shutdown_signal_handler(int /*signal*/) {
        g_shutdown_requested = 1;
    }

/**
 * @brief Route SIGINT and SIGTERM to the shutdown flag
 *
 * SA_RESTART is left off so a blocking read on stdin returns and the main
 * loop can see the flag.
 *
 * @throws std::runtime_error if sigaction fails
 */
    inline void install_shutdown_handler() {
        struct sigaction action {};
        action.sa_handler = shutdown_signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        if (sigaction(SIGINT, &action, nullptr) != 0 ||
            sigaction(SIGTERM, &action, nullptr) != 0) {
            throw std::runtime_error("Failed to install shutdown signal handler");
        }
    }

    inline bool shutdown_requested() {
        return g_shutdown_requested != 0;
    }

    inline void reset_shutdown_request() {
        g_shutdown_requested = 0;
    }

/**
 * @brief Blocks SIGINT and SIGTERM on the calling thread for its lifetime
 *
 * Threads started inside the scope inherit the mask, so shutdown signals
 * are only ever handled by the main thread.
 */
    class ScopedShutdownSignalBlock {
    public:
        ScopedShutdownSignalBlock() {
            sigset_t blocked;
            sigemptyset(&blocked);
            sigaddset(&blocked, SIGINT);
            sigaddset(&blocked, SIGTERM);
            if (pthread_sigmask(SIG_BLOCK, &blocked, &previous_) != 0) {
                throw std::runtime_error("Failed to block shutdown signals");
            }
        }

        ~ScopedShutdownSignalBlock() {
            pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
        }

        ScopedShutdownSignalBlock(const ScopedShutdownSignalBlock&) = delete;
        ScopedShutdownSignalBlock& operator=(const ScopedShutdownSignalBlock&) = delete;

    private:
        sigset_t previous_;
    };

} // namespace ftmsbridge
