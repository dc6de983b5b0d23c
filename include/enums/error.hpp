/**
 * @file error.hpp
 * @brief Status codes shared by the decoder, encoder, registry and control point.
 * @version 0.2
 * @date 2026-09-14
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace ftmsbridge {

/**
 * @enum Status
 * @brief Enumeration of error codes for ftmsbridge operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'W' it is a wire/payload-level condition (routine, recoverable).
 * If starts with 'D' it is a configuration or device-spec error (fatal at load time).
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,            /**< No error */
        WBAD_LENGTH = 1,        /**< Payload shorter than required */
        WBAD_MAGIC = 2,         /**< Magic byte mismatch */
        WBAD_VERSION = 3,       /**< Protocol version mismatch */
        WOUT_OF_RANGE = 4,      /**< Field read/write beyond buffer end */
        WBAD_OPCODE = 5,        /**< Unrecognized control point opcode */
        WBAD_PARAMETER = 6,     /**< Control point parameter missing or malformed */
        DSPEC_MISSING_FIELD = 7, /**< Device spec is missing a required key */
        DSPEC_INVALID = 8,      /**< Device spec has an invalid value */
        DSPEC_DUPLICATE = 9,    /**< Two specs map to the same characteristic or id */
        DCONFIG_ERROR = 10,     /**< Bridge configuration error */
        DNOT_FOUND = 11,        /**< File or directory not found */
        UNKNOWN = 255           /**< Unknown error */
    };

/**
 * @class FtmsErrorCategory
 * @brief Custom error category for ftmsbridge errors.
 */
    class FtmsErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "ftmsbridge::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::WBAD_LENGTH:
                    return "Bad payload length";
                case Status::WBAD_MAGIC:
                    return "Bad magic byte";
                case Status::WBAD_VERSION:
                    return "Bad protocol version";
                case Status::WOUT_OF_RANGE:
                    return "Offset out of range";
                case Status::WBAD_OPCODE:
                    return "Unsupported opcode";
                case Status::WBAD_PARAMETER:
                    return "Bad parameter";
                case Status::DSPEC_MISSING_FIELD:
                    return "Device spec missing field";
                case Status::DSPEC_INVALID:
                    return "Device spec invalid";
                case Status::DSPEC_DUPLICATE:
                    return "Device spec duplicate";
                case Status::DCONFIG_ERROR:
                    return "Configuration error";
                case Status::DNOT_FOUND:
                    return "Not found";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &ftms_category() {
        static FtmsErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), ftms_category()};
    }

} // namespace ftmsbridge

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<ftmsbridge::Status> : true_type {};
} // namespace std
