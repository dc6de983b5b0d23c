/**
 * @file device_spec.cpp
 * @brief JSON parsing and load-time validation of device specs
 * @version 1.0
 * @date 2026-09-16
 */

#include "spec/device_spec.hpp"
#include "spec/uuid.hpp"
#include "exception/ftms_exception.hpp"

#include <cmath>
#include <fstream>

using json = nlohmann::json;

namespace ftmsbridge {

    double round_hundredths(double value) {
        return std::floor(value * 100.0 + 0.5) / 100.0;
    }

    double FieldTransform::apply(std::int64_t raw) const {
        double value = static_cast<double>(raw);
        // Divisor first: some devices need divide-then-scale (tenths of a mile -> km)
        if (divisor) value /= *divisor;
        if (multiplier) value *= *multiplier;
        return round_hundredths(value);
    }

    std::optional<ComputedOp> computed_op_from_string(const std::string& name) {
        if (name == "multiply") return ComputedOp::MULTIPLY;
        if (name == "divide") return ComputedOp::DIVIDE;
        if (name == "sum") return ComputedOp::SUM;
        return std::nullopt;
    }

    std::string DeviceSpec::characteristic_key() const {
        return normalize_uuid(characteristic_uuid);
    }

    namespace {

        /**
         * @brief Typed accessors that report the offending spec and key path on failure
         */
        class SpecReader {
            public:
                explicit SpecReader(std::string label) : label_(std::move(label)) {}

                void relabel(const std::string& id, const std::string& origin) {
                    label_ = origin.empty() ? id : id + " (" + origin + ")";
                }

                [[noreturn]] void fail(Status status, const std::string& path,
                    const std::string& message) const {
                    throw ConfigException(status,
                              "device spec '" + label_ + "' field '" + path + "': " + message);
                }

                const json& require(const json& obj, const char* key, const std::string& path) const {
                    if (!obj.contains(key)) {
                        fail(Status::DSPEC_MISSING_FIELD, path, "required key is missing");
                    }
                    return obj.at(key);
                }

                std::string get_string(const json& value, const std::string& path) const {
                    if (!value.is_string()) {
                        fail(Status::DSPEC_INVALID, path, "expected a string");
                    }
                    return value.get<std::string>();
                }

                std::int64_t get_int(const json& value, const std::string& path) const {
                    if (!value.is_number_integer()) {
                        fail(Status::DSPEC_INVALID, path, "expected an integer");
                    }
                    return value.get<std::int64_t>();
                }

                std::size_t get_offset(const json& value, const std::string& path) const {
                    auto v = get_int(value, path);
                    if (v < 0) {
                        fail(Status::DSPEC_INVALID, path, "must not be negative");
                    }
                    return static_cast<std::size_t>(v);
                }

                double get_number(const json& value, const std::string& path) const {
                    if (!value.is_number()) {
                        fail(Status::DSPEC_INVALID, path, "expected a number");
                    }
                    return value.get<double>();
                }

                bool get_bool(const json& obj, const char* key, const std::string& path,
                    bool default_val) const {
                    if (!obj.contains(key)) return default_val;
                    const auto& value = obj.at(key);
                    if (!value.is_boolean()) {
                        fail(Status::DSPEC_INVALID, path + "." + key, "expected true or false");
                    }
                    return value.get<bool>();
                }

                // Byte values may be written as 2 or as "0x02"
                std::uint8_t get_byte(const json& value, const std::string& path) const {
                    std::int64_t v = 0;
                    if (value.is_string()) {
                        try {
                            v = std::stoll(value.get<std::string>(), nullptr, 0);
                        } catch (const std::exception&) {
                            fail(Status::DSPEC_INVALID, path, "not a byte value");
                        }
                    } else {
                        v = get_int(value, path);
                    }
                    if (v < 0 || v > 0xFF) {
                        fail(Status::DSPEC_INVALID, path, "byte value out of range 0..255");
                    }
                    return static_cast<std::uint8_t>(v);
                }

                // UUIDs may be "0x2ad2", a 128-bit string, or a JSON number
                std::string get_uuid(const json& value, const std::string& path) const {
                    if (value.is_number_unsigned() || value.is_number_integer()) {
                        auto v = value.get<std::int64_t>();
                        if (v < 0 || v > 0xFFFFFFFFLL) {
                            fail(Status::DSPEC_INVALID, path, "UUID out of range");
                        }
                        return format_short_uuid(static_cast<std::uint32_t>(v));
                    }
                    auto s = get_string(value, path);
                    if (s.empty()) {
                        fail(Status::DSPEC_INVALID, path, "UUID must not be empty");
                    }
                    return s;
                }

                FieldType get_type(const json& obj, const std::string& path) const {
                    auto name = get_string(require(obj, "type", path + ".type"), path + ".type");
                    auto type = field_type_from_string(name);
                    if (!type) {
                        fail(Status::DSPEC_INVALID, path + ".type", "unknown type '" + name + "'");
                    }
                    return *type;
                }

                FieldTransform get_transform(const json& obj, const std::string& path) const {
                    FieldTransform t;
                    if (obj.contains("divisor")) {
                        t.divisor = get_number(obj.at("divisor"), path + ".divisor");
                        if (*t.divisor == 0.0) {
                            fail(Status::DSPEC_INVALID, path + ".divisor", "divisor must not be 0");
                        }
                    }
                    if (obj.contains("multiplier")) {
                        t.multiplier = get_number(obj.at("multiplier"), path + ".multiplier");
                    }
                    return t;
                }

                // Stored fields must name a metric; marker-prefixed names are read and dropped
                std::optional<Metric> get_target(const std::string& name, const std::string& path,
                    bool discarded) const {
                    if (name.empty()) {
                        fail(Status::DSPEC_INVALID, path + ".name", "name must not be empty");
                    }
                    if (name.front() == INTERNAL_FIELD_MARKER || discarded) {
                        return std::nullopt;
                    }
                    auto metric = metric_from_name(name);
                    if (!metric) {
                        fail(Status::DSPEC_INVALID, path + ".name",
                            "'" + name + "' is not a known metric");
                    }
                    return metric;
                }

                ByteCheck get_byte_check(const json& obj, const std::string& path) const {
                    if (!obj.is_object()) {
                        fail(Status::DSPEC_INVALID, path, "expected an object");
                    }
                    ByteCheck check;
                    check.offset = get_offset(require(obj, "offset", path + ".offset"),
                            path + ".offset");
                    check.value = get_byte(require(obj, "value", path + ".value"), path + ".value");
                    return check;
                }

            private:
                std::string label_;
        };

        ValidationRules parse_validation(const SpecReader& r, const json& v) {
            ValidationRules rules;
            if (!v.is_object()) {
                r.fail(Status::DSPEC_INVALID, "validation", "expected an object");
            }
            if (v.contains("magicBytes")) {
                const auto& arr = v.at("magicBytes");
                if (!arr.is_array()) {
                    r.fail(Status::DSPEC_INVALID, "validation.magicBytes", "expected an array");
                }
                for (std::size_t i = 0; i < arr.size(); ++i) {
                    rules.magic_bytes.push_back(
                        r.get_byte_check(arr[i], "validation.magicBytes[" + std::to_string(i) + "]"));
                }
            }
            if (v.contains("versionCheck")) {
                rules.version_check = r.get_byte_check(v.at("versionCheck"),
                        "validation.versionCheck");
            }
            return rules;
        }

        FieldCondition parse_condition(const SpecReader& r, const json& c, const std::string& path) {
            if (!c.is_object()) {
                r.fail(Status::DSPEC_INVALID, path, "expected an object");
            }
            FieldCondition cond;
            if (c.contains("min")) cond.min = r.get_int(c.at("min"), path + ".min");
            if (c.contains("max")) cond.max = r.get_int(c.at("max"), path + ".max");
            if (cond.min && cond.max && *cond.min > *cond.max) {
                r.fail(Status::DSPEC_INVALID, path, "min is greater than max");
            }

            const bool has_offset = c.contains("flagOffset");
            const bool has_bit = c.contains("flagBit");
            if (has_offset != has_bit) {
                r.fail(Status::DSPEC_MISSING_FIELD, path,
                    "flagOffset and flagBit must be given together");
            }
            if (has_offset) {
                cond.flag_offset = r.get_offset(c.at("flagOffset"), path + ".flagOffset");
                auto bit = r.get_int(c.at("flagBit"), path + ".flagBit");
                if (bit < 0 || bit > 7) {
                    r.fail(Status::DSPEC_INVALID, path + ".flagBit", "must be 0..7");
                }
                cond.flag_bit = static_cast<unsigned>(bit);
            }
            cond.flag_value = r.get_bool(c, "flagValue", path, true);
            return cond;
        }

        StaticLayout parse_static(const SpecReader& r, const json& j) {
            if (j.contains("dynamicFields")) {
                r.fail(Status::DSPEC_INVALID, "dynamicFields", "not allowed in static mode");
            }
            const auto& arr = r.require(j, "fields", "fields");
            if (!arr.is_array()) {
                r.fail(Status::DSPEC_INVALID, "fields", "expected an array");
            }

            StaticLayout layout;
            for (std::size_t i = 0; i < arr.size(); ++i) {
                const std::string path = "fields[" + std::to_string(i) + "]";
                const auto& f = arr[i];
                if (!f.is_object()) {
                    r.fail(Status::DSPEC_INVALID, path, "expected an object");
                }

                StaticField field;
                field.name = r.get_string(r.require(f, "name", path + ".name"), path + ".name");
                field.target = r.get_target(field.name, path, false);
                field.offset = r.get_offset(r.require(f, "offset", path + ".offset"),
                        path + ".offset");
                field.type = r.get_type(f, path);
                if (f.contains("endian")) {
                    auto name = r.get_string(f.at("endian"), path + ".endian");
                    auto endian = endian_from_string(name);
                    if (!endian) {
                        r.fail(Status::DSPEC_INVALID, path + ".endian",
                            "expected 'little' or 'big', got '" + name + "'");
                    }
                    field.endian = *endian;
                }
                field.transform = r.get_transform(f, path);
                if (f.contains("condition")) {
                    field.condition = parse_condition(r, f.at("condition"), path + ".condition");
                }
                layout.fields.push_back(std::move(field));
            }
            return layout;
        }

        DynamicLayout parse_dynamic(const SpecReader& r, const json& j) {
            if (j.contains("fields")) {
                r.fail(Status::DSPEC_INVALID, "fields", "not allowed in dynamic mode");
            }
            const auto& arr = r.require(j, "dynamicFields", "dynamicFields");
            if (!arr.is_array() || arr.empty()) {
                r.fail(Status::DSPEC_INVALID, "dynamicFields", "expected a non-empty array");
            }

            DynamicLayout layout;
            if (j.contains("flagOffset")) {
                layout.flag_offset = r.get_offset(j.at("flagOffset"), "flagOffset");
            }
            if (j.contains("flagSize")) {
                auto size = r.get_int(j.at("flagSize"), "flagSize");
                if (size != 1 && size != 2) {
                    r.fail(Status::DSPEC_INVALID, "flagSize", "must be 1 or 2");
                }
                layout.flag_size = static_cast<std::size_t>(size);
            }
            const auto flag_bits = static_cast<std::int64_t>(layout.flag_size * 8);

            for (std::size_t i = 0; i < arr.size(); ++i) {
                const std::string path = "dynamicFields[" + std::to_string(i) + "]";
                const auto& f = arr[i];
                if (!f.is_object()) {
                    r.fail(Status::DSPEC_INVALID, path, "expected an object");
                }

                DynamicField field;
                field.name = r.get_string(r.require(f, "name", path + ".name"), path + ".name");
                field.type = r.get_type(f, path);
                field.skip = r.get_bool(f, "skip", path, false);
                field.linked_to_previous = r.get_bool(f, "linkedToPrevious", path, false);
                field.flag_inverted = r.get_bool(f, "flagInverted", path, false);
                field.transform = r.get_transform(f, path);
                field.target = r.get_target(field.name, path,
                        field.skip || field.linked_to_previous);

                if (field.linked_to_previous && i == 0) {
                    r.fail(Status::DSPEC_INVALID, path + ".linkedToPrevious",
                        "first dynamic field has no predecessor");
                }
                if (f.contains("flagBit")) {
                    auto bit = r.get_int(f.at("flagBit"), path + ".flagBit");
                    if (bit < 0 || bit >= flag_bits) {
                        r.fail(Status::DSPEC_INVALID, path + ".flagBit",
                            "must be 0.." + std::to_string(flag_bits - 1));
                    }
                    field.flag_bit = static_cast<unsigned>(bit);
                } else if (!field.linked_to_previous) {
                    r.fail(Status::DSPEC_MISSING_FIELD, path + ".flagBit",
                        "required key is missing");
                }
                layout.fields.push_back(std::move(field));
            }
            return layout;
        }

        std::vector<ComputedField> parse_computed(const SpecReader& r, const json& arr) {
            if (!arr.is_array()) {
                r.fail(Status::DSPEC_INVALID, "computed", "expected an array");
            }

            std::vector<ComputedField> computed;
            for (std::size_t i = 0; i < arr.size(); ++i) {
                const std::string path = "computed[" + std::to_string(i) + "]";
                const auto& c = arr[i];
                if (!c.is_object()) {
                    r.fail(Status::DSPEC_INVALID, path, "expected an object");
                }

                ComputedField field;
                field.name = r.get_string(r.require(c, "name", path + ".name"), path + ".name");
                auto target = metric_from_name(field.name);
                if (!target) {
                    r.fail(Status::DSPEC_INVALID, path + ".name",
                        "'" + field.name + "' is not a known metric");
                }
                field.target = *target;

                auto op_name = r.get_string(r.require(c, "operation", path + ".operation"),
                        path + ".operation");
                auto op = computed_op_from_string(op_name);
                if (!op) {
                    r.fail(Status::DSPEC_INVALID, path + ".operation",
                        "unknown operation '" + op_name + "'");
                }
                field.operation = *op;

                const auto& operands = r.require(c, "operands", path + ".operands");
                if (!operands.is_array() || operands.empty()) {
                    r.fail(Status::DSPEC_INVALID, path + ".operands", "expected a non-empty array");
                }
                for (std::size_t k = 0; k < operands.size(); ++k) {
                    const std::string op_path = path + ".operands[" + std::to_string(k) + "]";
                    auto name = r.get_string(operands[k], op_path);
                    auto metric = metric_from_name(name);
                    if (!metric) {
                        r.fail(Status::DSPEC_INVALID, op_path, "'" + name + "' is not a known metric");
                    }
                    field.operands.push_back(*metric);
                }
                if (field.operation == ComputedOp::DIVIDE && field.operands.size() != 2) {
                    r.fail(Status::DSPEC_INVALID, path + ".operands",
                        "divide takes exactly two operands");
                }
                if (c.contains("factor")) {
                    field.factor = r.get_number(c.at("factor"), path + ".factor");
                }
                computed.push_back(std::move(field));
            }
            return computed;
        }

    } // namespace

    DeviceSpec DeviceSpec::from_json(const json& j, const std::string& origin) {
        SpecReader r(origin.empty() ? std::string("<unnamed>") : origin);
        if (!j.is_object()) {
            r.fail(Status::DSPEC_INVALID, "<root>", "expected a JSON object");
        }

        DeviceSpec spec;
        spec.id = r.get_string(r.require(j, "id", "id"), "id");
        if (spec.id.empty()) {
            r.fail(Status::DSPEC_INVALID, "id", "must not be empty");
        }
        r.relabel(spec.id, origin);

        spec.name = r.get_string(r.require(j, "name", "name"), "name");
        spec.service_uuid = r.get_uuid(r.require(j, "serviceUuid", "serviceUuid"), "serviceUuid");
        spec.characteristic_uuid = r.get_uuid(
            r.require(j, "characteristicUuid", "characteristicUuid"), "characteristicUuid");

        if (j.contains("description")) {
            spec.description = r.get_string(j.at("description"), "description");
        }
        if (j.contains("minLength")) {
            spec.min_length = r.get_offset(j.at("minLength"), "minLength");
        }
        if (j.contains("validation")) {
            spec.validation = parse_validation(r, j.at("validation"));
        }

        std::string mode = "static";
        if (j.contains("mode")) {
            mode = r.get_string(j.at("mode"), "mode");
        }
        if (mode == "static") {
            spec.layout = parse_static(r, j);
        } else if (mode == "dynamic") {
            spec.layout = parse_dynamic(r, j);
        } else {
            r.fail(Status::DSPEC_INVALID, "mode", "expected 'static' or 'dynamic', got '" + mode + "'");
        }

        if (j.contains("computed")) {
            spec.computed = parse_computed(r, j.at("computed"));
        }
        return spec;
    }

    DeviceSpec DeviceSpec::from_file(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigException(Status::DNOT_FOUND, "Cannot open device spec file: " + path);
        }

        json j;
        try {
            file >> j;
        } catch (const json::exception& e) {
            throw ConfigException(Status::DSPEC_INVALID,
                      "JSON parse error in " + path + ": " + e.what());
        }
        return from_json(j, path);
    }

} // namespace ftmsbridge
