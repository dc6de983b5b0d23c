/**
 * @file field_codec.hpp
 * @brief Fixed-width integer readers/writers shared by the decode and encode paths
 * @version 1.0
 * @date 2026-09-15
 *
 * Pure static helpers with no state. All methods work on raw byte buffers
 * using offsets provided by the caller.
 *
 * Supported field types and widths:
 * | Type   | Width | Endianness                              |
 * |--------|-------|-----------------------------------------|
 * | uint8  | 1     | n/a                                     |
 * | uint16 | 2     | little or big                           |
 * | int16  | 2     | little or big                           |
 * | uint24 | 3     | always little (BLE convention)          |
 * | uint32 | 4     | little or big                           |
 * | int32  | 4     | little or big                           |
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <boost/core/span.hpp>

#include "../enums/error.hpp"
#include "../exception/ftms_exception.hpp"
#include "../template/result.hpp"

namespace ftmsbridge {

    using boost::span;

    /**
     * @brief Integer encodings a device spec field can declare
     */
    enum class FieldType : std::uint8_t {
        UINT8,
        UINT16,
        INT16,
        UINT24,
        UINT32,
        INT32
    };

    enum class Endian : std::uint8_t {
        LITTLE,
        BIG
    };

    /**
     * @brief Width in bytes of a field type. Depends on the type only.
     */
    constexpr std::size_t field_width(FieldType type) {
        switch (type) {
        case FieldType::UINT8:
            return 1;
        case FieldType::UINT16:
        case FieldType::INT16:
            return 2;
        case FieldType::UINT24:
            return 3;
        case FieldType::UINT32:
        case FieldType::INT32:
            return 4;
        }
        return 1;
    }

    constexpr bool is_signed(FieldType type) {
        return type == FieldType::INT16 || type == FieldType::INT32;
    }

    /**
     * @brief Parse the JSON spelling of a field type ("uint8", "int16", ...)
     * @return std::nullopt for unknown spellings
     */
    inline std::optional<FieldType> field_type_from_string(const std::string& name) {
        if (name == "uint8") return FieldType::UINT8;
        if (name == "uint16") return FieldType::UINT16;
        if (name == "int16") return FieldType::INT16;
        if (name == "uint24") return FieldType::UINT24;
        if (name == "uint32") return FieldType::UINT32;
        if (name == "int32") return FieldType::INT32;
        return std::nullopt;
    }

    inline std::string to_string(FieldType type) {
        switch (type) {
        case FieldType::UINT8: return "uint8";
        case FieldType::UINT16: return "uint16";
        case FieldType::INT16: return "int16";
        case FieldType::UINT24: return "uint24";
        case FieldType::UINT32: return "uint32";
        case FieldType::INT32: return "int32";
        }
        return "unknown";
    }

    inline std::optional<Endian> endian_from_string(const std::string& name) {
        if (name == "little") return Endian::LITTLE;
        if (name == "big") return Endian::BIG;
        return std::nullopt;
    }

    /**
     * @brief Static helper for reading and writing fixed-width integers
     *
     * Offsets are byte-granular. Values are widened to int64_t so every
     * supported type (including uint32) fits without loss.
     */
    class FieldCodec {
        public:
            /**
             * @brief Check that [offset, offset + width) lies inside a buffer of given size
             */
            static constexpr bool fits(std::size_t buffer_size, std::size_t offset,
                FieldType type) {
                return offset <= buffer_size && field_width(type) <= buffer_size - offset;
            }

            /**
             * @brief Read a field from a buffer
             *
             * @param data Buffer containing the payload
             * @param offset Byte offset of the first byte of the field
             * @param type Field encoding
             * @param endian Byte order (ignored for uint8 and uint24)
             * @return std::int64_t The decoded value
             * @throws ProtocolException (WOUT_OF_RANGE) if offset + width exceeds the buffer
             *
             * @example
             * @code
             * // Cycling Power Measurement: int16 LE at offset 2
             * auto watts = FieldCodec::read(payload, 2, FieldType::INT16, Endian::LITTLE);
             * @endcode
             */
            static std::int64_t read(span<const std::uint8_t> data,
                std::size_t offset,
                FieldType type,
                Endian endian = Endian::LITTLE) {
                if (!fits(data.size(), offset, type)) {
                    throw ProtocolException(Status::WOUT_OF_RANGE,
                        "FieldCodec::read " + to_string(type) + " at offset " +
                        std::to_string(offset) + " of " + std::to_string(data.size()) +
                        "-byte buffer");
                }
                return read_unchecked(data, offset, type, endian);
            }

            /**
             * @brief Non-throwing variant of read()
             * @return Result holding the value, or WOUT_OF_RANGE
             */
            static Result<std::int64_t> try_read(span<const std::uint8_t> data,
                std::size_t offset,
                FieldType type,
                Endian endian = Endian::LITTLE) {
                if (!fits(data.size(), offset, type)) {
                    return Result<std::int64_t>::error(Status::WOUT_OF_RANGE,
                        "FieldCodec::try_read");
                }
                return Result<std::int64_t>::success(read_unchecked(data, offset, type, endian));
            }

            /**
             * @brief Write a field into a buffer (mirror of read())
             *
             * The value is truncated to the field width (two's complement for
             * signed types). Callers clamp beforehand when saturation is wanted.
             *
             * @throws ProtocolException (WOUT_OF_RANGE) if offset + width exceeds the buffer
             */
            static void write(span<std::uint8_t> data,
                std::size_t offset,
                FieldType type,
                Endian endian,
                std::int64_t value) {
                if (!fits(data.size(), offset, type)) {
                    throw ProtocolException(Status::WOUT_OF_RANGE,
                        "FieldCodec::write " + to_string(type) + " at offset " +
                        std::to_string(offset));
                }

                const std::size_t width = field_width(type);
                const auto raw = static_cast<std::uint64_t>(value);
                const bool big = endian == Endian::BIG && type != FieldType::UINT24;
                for (std::size_t i = 0; i < width; ++i) {
                    const std::size_t pos = big ? offset + (width - 1 - i) : offset + i;
                    data[pos] = static_cast<std::uint8_t>((raw >> (8 * i)) & 0xFF);
                }
            }

        private:
            static std::int64_t read_unchecked(span<const std::uint8_t> data,
                std::size_t offset,
                FieldType type,
                Endian endian) {
                const std::size_t width = field_width(type);
                // uint24 has no big-endian form in BLE profiles
                const bool big = endian == Endian::BIG && type != FieldType::UINT24;

                std::uint32_t raw = 0;
                for (std::size_t i = 0; i < width; ++i) {
                    const std::size_t pos = big ? offset + (width - 1 - i) : offset + i;
                    raw |= static_cast<std::uint32_t>(data[pos]) << (8 * i);
                }

                switch (type) {
                case FieldType::INT16:
                    return static_cast<std::int16_t>(static_cast<std::uint16_t>(raw));
                case FieldType::INT32:
                    return static_cast<std::int32_t>(raw);
                default:
                    return static_cast<std::int64_t>(raw);
                }
            }
    };

} // namespace ftmsbridge
