/**
 * @file spec_decoder.cpp
 * @brief Spec-driven payload decoding
 * @version 1.0
 * @date 2026-09-17
 */

#include "decoder/spec_decoder.hpp"

#include <variant>
#include <vector>

namespace ftmsbridge {

    namespace {

        using Payload = boost::span<const std::uint8_t>;

        bool flag_bit_set(std::int64_t flags, unsigned bit) {
            return ((static_cast<std::uint64_t>(flags) >> bit) & 1U) != 0;
        }

        bool condition_passes(const FieldCondition& cond, Payload payload,
            const StaticField& field) {
            if (cond.has_flag_check()) {
                auto flags = FieldCodec::try_read(payload, *cond.flag_offset, FieldType::UINT8);
                if (!flags) {
                    return false;
                }
                if (flag_bit_set(flags.value(), *cond.flag_bit) != cond.flag_value) {
                    return false;
                }
            }

            if (cond.has_range()) {
                auto raw = FieldCodec::try_read(payload, field.offset, field.type, field.endian);
                if (!raw) {
                    return false;
                }
                if (cond.min && raw.value() < *cond.min) return false;
                if (cond.max && raw.value() > *cond.max) return false;
            }
            return true;
        }

        /**
         * @brief Extracts raw fields into a record, one overload per layout kind
         */
        struct FieldExtractor {
            Payload payload;
            MetricRecord& record;

            void operator()(const StaticLayout& layout) const {
                for (const auto& field : layout.fields) {
                    // Too short for this field: skip it, later fields may still fit
                    if (!FieldCodec::fits(payload.size(), field.offset, field.type)) {
                        continue;
                    }
                    if (field.condition && !condition_passes(*field.condition, payload, field)) {
                        continue;
                    }

                    auto raw = FieldCodec::try_read(payload, field.offset, field.type,
                            field.endian);
                    if (!raw) {
                        continue;
                    }
                    if (field.target) {
                        record.set(*field.target, field.transform.apply(raw.value()));
                    }
                }
            }

            void operator()(const DynamicLayout& layout) const {
                const FieldType flag_type = layout.flag_size == 1 ? FieldType::UINT8
                                                                  : FieldType::UINT16;
                auto flags = FieldCodec::try_read(payload, layout.flag_offset, flag_type);
                if (!flags) {
                    return;
                }

                std::size_t cursor = layout.flag_offset + layout.flag_size;
                bool group_present = false;

                for (const auto& field : layout.fields) {
                    const std::size_t width = field_width(field.type);

                    if (field.linked_to_previous) {
                        if (!group_present) {
                            continue;
                        }
                        if (!FieldCodec::fits(payload.size(), cursor, field.type)) {
                            return;
                        }
                        cursor += width;
                        continue;
                    }

                    const bool present = flag_bit_set(flags.value(), field.flag_bit) !=
                        field.flag_inverted;
                    group_present = present;
                    if (!present) {
                        continue;
                    }

                    auto raw = FieldCodec::try_read(payload, cursor, field.type);
                    if (!raw) {
                        // Truncated notification: every later offset is unknown
                        return;
                    }
                    cursor += width;

                    if (field.skip || !field.target) {
                        continue;
                    }
                    record.set(*field.target, field.transform.apply(raw.value()));
                }
            }
        };

        void apply_computed(const std::vector<ComputedField>& computed, MetricRecord& record) {
            std::vector<double> values;
            for (const auto& field : computed) {
                values.clear();
                bool complete = true;
                for (auto operand : field.operands) {
                    auto value = record.get(operand);
                    if (!value) {
                        complete = false;
                        break;
                    }
                    values.push_back(*value);
                }
                if (!complete) {
                    continue;
                }

                double result = 0.0;
                switch (field.operation) {
                case ComputedOp::MULTIPLY:
                    result = 1.0;
                    for (double v : values) result *= v;
                    result *= field.factor.value_or(1.0);
                    break;
                case ComputedOp::DIVIDE:
                    if (values[1] == 0.0) {
                        continue;
                    }
                    result = values[0] / values[1];
                    break;
                case ComputedOp::SUM:
                    for (double v : values) result += v;
                    break;
                }
                record.set(field.target, round_hundredths(result));
            }
        }

    } // namespace

    Result<void> SpecDecoder::accepts(const DeviceSpec& spec, Payload payload) {
        if (payload.size() < spec.min_length) {
            return Result<void>::error(Status::WBAD_LENGTH, "minLength " + spec.id);
        }

        for (const auto& check : spec.validation.magic_bytes) {
            // Not enough bytes to check counts as a mismatch
            if (check.offset >= payload.size() || payload[check.offset] != check.value) {
                return Result<void>::error(Status::WBAD_MAGIC,
                           "magic byte " + std::to_string(check.offset) + " " + spec.id);
            }
        }

        if (const auto& version = spec.validation.version_check) {
            if (version->offset >= payload.size() || payload[version->offset] != version->value) {
                return Result<void>::error(Status::WBAD_VERSION, "version " + spec.id);
            }
        }

        if (const auto* dynamic = std::get_if<DynamicLayout>(&spec.layout)) {
            if (payload.size() < dynamic->flag_offset + dynamic->flag_size) {
                return Result<void>::error(Status::WBAD_LENGTH, "flags " + spec.id);
            }
        }
        return Result<void>::success();
    }

    MetricRecord SpecDecoder::decode(const DeviceSpec& spec, Payload payload) {
        MetricRecord record;
        if (!accepts(spec, payload)) {
            return record;
        }

        std::visit(FieldExtractor{payload, record}, spec.layout);
        apply_computed(spec.computed, record);
        record.set_source_type(spec.id);
        return record;
    }

    MetricRecord SpecDecoder::decode(const std::string& characteristic, Payload payload) const {
        const DeviceSpec* spec = registry_.lookup(characteristic);
        if (spec == nullptr) {
            return MetricRecord{};
        }
        return decode(*spec, payload);
    }

} // namespace ftmsbridge
