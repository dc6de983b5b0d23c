/**
 * @file control_point.hpp
 * @brief FTMS Fitness Machine Control Point (0x2AD9) state machine
 * @version 1.0
 * @date 2026-09-19
 *
 * Each write carries an opcode byte and optional parameters. Every write with
 * an opcode gets exactly one response {0x80, opcode, result}, which the
 * caller sends as an indication.
 *
 * State transitions:
 * IDLE --RequestControl--> CONTROL_REQUESTED --Start--> RUNNING
 *                                            --Stop---> STOPPED
 * any --Reset--> IDLE (targets and control grant cleared)
 */

#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <boost/core/span.hpp>

#include "../template/result.hpp"

namespace ftmsbridge {

    namespace control {

        enum class State : std::uint8_t {
            IDLE,
            CONTROL_REQUESTED,
            RUNNING,
            STOPPED
        };

        enum class OpCode : std::uint8_t {
            REQUEST_CONTROL = 0x00,
            RESET = 0x01,
            SET_TARGET_RESISTANCE = 0x04,
            SET_TARGET_POWER = 0x05,
            START_OR_RESUME = 0x07,
            STOP_OR_PAUSE = 0x08,
            RESPONSE_CODE = 0x80
        };

        enum class ResultCode : std::uint8_t {
            SUCCESS = 0x01,
            NOT_SUPPORTED = 0x02,
            INVALID_PARAMETER = 0x03,
            OPERATION_FAILED = 0x04,
            CONTROL_NOT_PERMITTED = 0x05
        };

        /// Stop/Pause parameter values
        constexpr std::uint8_t STOP = 0x01;
        constexpr std::uint8_t PAUSE = 0x02;

        std::string state_to_string(State state);

    } // namespace control

    /**
     * @brief Response to one control point write
     */
    struct ControlPointResponse {
        std::uint8_t request_opcode = 0;
        control::ResultCode result = control::ResultCode::SUCCESS;

        std::array<std::uint8_t, 3> to_bytes() const {
            return {static_cast<std::uint8_t>(control::OpCode::RESPONSE_CODE), request_opcode,
                    static_cast<std::uint8_t>(result)};
        }
    };

    /**
     * @class ControlPoint
     * @brief Tracks control ownership, session state and requested targets
     *
     * Targets are recorded only. Nothing is forwarded to the physical device.
     * Thread-safe: writes and accessor calls may come from different threads.
     */
    class ControlPoint {
        public:
            /**
             * @param enforce_control Refuse every opcode except Request Control
             *        with CONTROL_NOT_PERMITTED until control has been granted
             */
            explicit ControlPoint(bool enforce_control = false)
                : enforce_control_(enforce_control) {}

            /**
             * @brief Process one write to the control point
             * @param request Raw bytes written by the client
             * @return Response to indicate, or WBAD_LENGTH for an empty write
             *         (no opcode, so no response is possible)
             */
            Result<ControlPointResponse> handle(boost::span<const std::uint8_t> request);

            // === State queries ===
            control::State state() const;
            bool control_granted() const;
            bool paused() const;
            std::optional<std::int16_t> target_power() const;
            std::optional<std::uint8_t> target_resistance() const;

            bool enforces_control() const { return enforce_control_; }

            /// Back to IDLE with no targets, as after a Reset opcode
            void reset();

        private:
            control::ResultCode apply(control::OpCode opcode,
                boost::span<const std::uint8_t> params);
            void reset_locked();

            const bool enforce_control_;

            mutable std::mutex mutex_;
            control::State state_ = control::State::IDLE;
            bool control_granted_ = false;
            bool paused_ = false;
            std::optional<std::int16_t> target_power_;
            std::optional<std::uint8_t> target_resistance_;
    };

} // namespace ftmsbridge
