/**
 * @file control_point.cpp
 * @brief FTMS control point implementation
 * @version 1.0
 * @date 2026-09-19
 */

#include "ftms/control_point.hpp"
#include "codec/field_codec.hpp"

#include <iostream>

namespace ftmsbridge {

    std::string control::state_to_string(State state) {
        switch (state) {
        case State::IDLE:
            return "IDLE";
        case State::CONTROL_REQUESTED:
            return "CONTROL_REQUESTED";
        case State::RUNNING:
            return "RUNNING";
        case State::STOPPED:
            return "STOPPED";
        }
        return "UNKNOWN";
    }

    namespace {

        bool is_supported(std::uint8_t opcode) {
            switch (static_cast<control::OpCode>(opcode)) {
            case control::OpCode::REQUEST_CONTROL:
            case control::OpCode::RESET:
            case control::OpCode::SET_TARGET_RESISTANCE:
            case control::OpCode::SET_TARGET_POWER:
            case control::OpCode::START_OR_RESUME:
            case control::OpCode::STOP_OR_PAUSE:
                return true;
            default:
                return false;
            }
        }

    } // namespace

    Result<ControlPointResponse> ControlPoint::handle(boost::span<const std::uint8_t> request) {
        if (request.empty()) {
            return Result<ControlPointResponse>::error(Status::WBAD_LENGTH,
                       "ControlPoint::handle");
        }

        ControlPointResponse response;
        response.request_opcode = request[0];

        if (!is_supported(request[0])) {
            std::cout << "[ControlPoint] Unsupported opcode 0x" << std::hex
                      << static_cast<int>(request[0]) << std::dec << std::endl;
            response.result = control::ResultCode::NOT_SUPPORTED;
            return Result<ControlPointResponse>::success(response);
        }

        const auto opcode = static_cast<control::OpCode>(request[0]);
        std::lock_guard<std::mutex> lock(mutex_);

        if (enforce_control_ && !control_granted_ &&
            opcode != control::OpCode::REQUEST_CONTROL) {
            std::cerr << "[ControlPoint] Opcode 0x" << std::hex << static_cast<int>(request[0])
                      << std::dec << " refused: control not granted" << std::endl;
            response.result = control::ResultCode::CONTROL_NOT_PERMITTED;
            return Result<ControlPointResponse>::success(response);
        }

        response.result = apply(opcode, request.subspan(1));
        return Result<ControlPointResponse>::success(response);
    }

    control::ResultCode ControlPoint::apply(control::OpCode opcode,
        boost::span<const std::uint8_t> params) {
        switch (opcode) {
        case control::OpCode::REQUEST_CONTROL:
            control_granted_ = true;
            state_ = control::State::CONTROL_REQUESTED;
            std::cout << "[ControlPoint] Control granted" << std::endl;
            break;

        case control::OpCode::RESET:
            reset_locked();
            std::cout << "[ControlPoint] Reset" << std::endl;
            break;

        case control::OpCode::SET_TARGET_RESISTANCE:
            // A missing parameter is still acknowledged, nothing is stored
            if (!params.empty()) {
                target_resistance_ = params[0];
                std::cout << "[ControlPoint] Target resistance set: "
                          << static_cast<int>(params[0]) << std::endl;
            }
            break;

        case control::OpCode::SET_TARGET_POWER: {
            auto watts = FieldCodec::try_read(params, 0, FieldType::INT16);
            if (watts) {
                target_power_ = static_cast<std::int16_t>(watts.value());
                std::cout << "[ControlPoint] Target power set: " << watts.value() << "W"
                          << std::endl;
            }
            break;
        }

        case control::OpCode::START_OR_RESUME:
            state_ = control::State::RUNNING;
            paused_ = false;
            std::cout << "[ControlPoint] Started" << std::endl;
            break;

        case control::OpCode::STOP_OR_PAUSE: {
            const std::uint8_t param = params.empty() ? control::STOP : params[0];
            state_ = control::State::STOPPED;
            paused_ = param == control::PAUSE;
            std::cout << "[ControlPoint] " << (paused_ ? "Paused" : "Stopped") << std::endl;
            break;
        }

        default:
            return control::ResultCode::NOT_SUPPORTED;
        }
        return control::ResultCode::SUCCESS;
    }

    void ControlPoint::reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_locked();
    }

    void ControlPoint::reset_locked() {
        state_ = control::State::IDLE;
        control_granted_ = false;
        paused_ = false;
        target_power_.reset();
        target_resistance_.reset();
    }

    control::State ControlPoint::state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool ControlPoint::control_granted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return control_granted_;
    }

    bool ControlPoint::paused() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paused_;
    }

    std::optional<std::int16_t> ControlPoint::target_power() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_power_;
    }

    std::optional<std::uint8_t> ControlPoint::target_resistance() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_resistance_;
    }

} // namespace ftmsbridge
