/**
 * @file ftms_exception.hpp
 * @brief Exception hierarchy for the ftmsbridge library
 * @version 0.2
 * @date 2026-09-14
 *
 * Exceptions are reserved for load-time integrity checks and programming
 * errors. Per-packet problems never surface as exceptions.
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace ftmsbridge {

    /**
     * @class FtmsException
     * @brief Base exception class for all ftmsbridge errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class FtmsException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, spec id, etc.)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            FtmsException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             */
            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                FtmsErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ProtocolException
     * @brief Byte-level errors (W* status codes), e.g. a codec read past the buffer end.
     */
    class ProtocolException : public FtmsException {
        public:
            using FtmsException::FtmsException;
    };

    /**
     * @class ConfigException
     * @brief Device spec and bridge configuration errors (D* status codes).
     *
     * Thrown while loading specs or configuration; startup must stop.
     */
    class ConfigException : public FtmsException {
        public:
            using FtmsException::FtmsException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @throws ProtocolException for W* codes
     * @throws ConfigException for D* codes
     * @throws FtmsException for other codes
     */
    inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::WBAD_LENGTH:
        case Status::WBAD_MAGIC:
        case Status::WBAD_VERSION:
        case Status::WOUT_OF_RANGE:
        case Status::WBAD_OPCODE:
        case Status::WBAD_PARAMETER:
            throw ProtocolException(status, context);

        case Status::DSPEC_MISSING_FIELD:
        case Status::DSPEC_INVALID:
        case Status::DSPEC_DUPLICATE:
        case Status::DCONFIG_ERROR:
        case Status::DNOT_FOUND:
            throw ConfigException(status, context);

        default:
            throw FtmsException(status, context);
        }
    }

    /**
     * @brief Throw if status indicates an error (not SUCCESS)
     */
    inline void throw_if_error(Status status, const std::string& context) {
        if (status != Status::SUCCESS) {
            throw_error(status, context);
        }
    }

} // namespace ftmsbridge
