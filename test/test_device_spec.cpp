/**
 * @file test_device_spec.cpp
 * @brief Unit tests for device spec parsing and load-time validation
 * @version 1.0
 * @date 2026-09-26
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>

#include "test_utils.hpp"
#include "../include/exception/ftms_exception.hpp"

using namespace ftmsbridge;
using namespace ftmsbridge::test;

namespace {

    Status spec_error(const std::string& json_text) {
        try {
            make_spec(json_text);
        } catch (const ConfigException& e) {
            return e.status();
        }
        return Status::SUCCESS;
    }

    std::string spec_message(const std::string& json_text) {
        try {
            make_spec(json_text);
        } catch (const ConfigException& e) {
            return e.what();
        }
        return "";
    }

} // namespace

TEST_CASE("DeviceSpec::from_json - Static spec", "[spec][parse]") {
    auto spec = make_spec(R"({
        "id": "power-meter", "name": "Power Meter",
        "serviceUuid": "0x1818", "characteristicUuid": "0x2A63",
        "minLength": 4,
        "fields": [
            { "name": "power", "offset": 2, "type": "int16" },
            { "name": "speed", "offset": 0, "type": "uint16", "endian": "big",
              "divisor": 100, "condition": { "min": 1, "max": 250 } },
            { "name": "_reserved", "offset": 1, "type": "uint8" }
        ]
    })");

    REQUIRE(spec.id == "power-meter");
    REQUIRE(spec.mode() == SpecMode::STATIC);
    REQUIRE(spec.min_length == 4);
    REQUIRE(spec.characteristic_key() == "2a63");

    const auto& fields = std::get<StaticLayout>(spec.layout).fields;
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[0].target == Metric::POWER);
    REQUIRE(fields[0].type == FieldType::INT16);
    REQUIRE(fields[1].endian == Endian::BIG);
    REQUIRE(fields[1].transform.divisor.value() == Catch::Approx(100.0));
    REQUIRE(fields[1].condition->min == 1);
    REQUIRE(fields[1].condition->max == 250);
    REQUIRE_FALSE(fields[2].target.has_value());
}

TEST_CASE("DeviceSpec::from_json - Dynamic spec", "[spec][parse]") {
    auto spec = make_spec(R"({
        "id": "ftms", "name": "FTMS", "mode": "dynamic",
        "serviceUuid": "0x1826", "characteristicUuid": "0x2AD2",
        "flagSize": 2,
        "dynamicFields": [
            { "name": "speed", "flagBit": 0, "flagInverted": true, "type": "uint16", "divisor": 100 },
            { "name": "calories", "flagBit": 8, "type": "uint16" },
            { "name": "_energyPerHour", "type": "uint16", "linkedToPrevious": true }
        ]
    })");

    REQUIRE(spec.mode() == SpecMode::DYNAMIC);
    const auto& layout = std::get<DynamicLayout>(spec.layout);
    REQUIRE(layout.flag_size == 2);
    REQUIRE(layout.fields[0].flag_inverted);
    REQUIRE(layout.fields[1].flag_bit == 8);
    REQUIRE(layout.fields[2].linked_to_previous);
    REQUIRE_FALSE(layout.fields[2].target.has_value());
}

TEST_CASE("DeviceSpec::from_json - Byte values accept hex strings", "[spec][parse]") {
    auto spec = make_spec(R"({
        "id": "m", "name": "M", "serviceUuid": "0x0001", "characteristicUuid": "0x0002",
        "validation": {
            "magicBytes": [ { "offset": 0, "value": "0xF0" }, { "offset": 1, "value": 1 } ],
            "versionCheck": { "offset": 2, "value": 6 }
        },
        "fields": [ { "name": "gear", "offset": 3, "type": "uint8" } ]
    })");

    REQUIRE(spec.validation.magic_bytes.size() == 2);
    REQUIRE(spec.validation.magic_bytes[0].value == 0xF0);
    REQUIRE(spec.validation.version_check->value == 6);
}

TEST_CASE("DeviceSpec::from_json - Missing required keys", "[spec][validation]") {
    SECTION("No id") {
        REQUIRE(spec_error(R"({ "name": "x", "serviceUuid": "0x1", "characteristicUuid": "0x2",
            "fields": [] })") == Status::DSPEC_MISSING_FIELD);
    }

    SECTION("No characteristicUuid") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "fields": [] })") == Status::DSPEC_MISSING_FIELD);
    }

    SECTION("Static field without offset") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "characteristicUuid": "0x2",
            "fields": [ { "name": "power", "type": "int16" } ] })") ==
            Status::DSPEC_MISSING_FIELD);
    }

    SECTION("Dynamic field without flagBit") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "mode": "dynamic",
            "serviceUuid": "0x1", "characteristicUuid": "0x2",
            "dynamicFields": [ { "name": "power", "type": "int16" } ] })") ==
            Status::DSPEC_MISSING_FIELD);
    }
}

TEST_CASE("DeviceSpec::from_json - Invalid values", "[spec][validation]") {
    SECTION("Unknown field type") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "characteristicUuid": "0x2",
            "fields": [ { "name": "power", "offset": 0, "type": "float" } ] })") ==
            Status::DSPEC_INVALID);
    }

    SECTION("Unknown mode") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "mode": "hybrid",
            "serviceUuid": "0x1", "characteristicUuid": "0x2", "fields": [] })") ==
            Status::DSPEC_INVALID);
    }

    SECTION("Unknown metric name") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "characteristicUuid": "0x2",
            "fields": [ { "name": "torque", "offset": 0, "type": "uint8" } ] })") ==
            Status::DSPEC_INVALID);
    }

    SECTION("Zero divisor") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "characteristicUuid": "0x2",
            "fields": [ { "name": "power", "offset": 0, "type": "uint8", "divisor": 0 } ] })") ==
            Status::DSPEC_INVALID);
    }

    SECTION("Flag bit outside a one-byte flags word") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "mode": "dynamic", "flagSize": 1,
            "serviceUuid": "0x1", "characteristicUuid": "0x2",
            "dynamicFields": [ { "name": "power", "flagBit": 8, "type": "int16" } ] })") ==
            Status::DSPEC_INVALID);
    }

    SECTION("Magic byte above 255") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "characteristicUuid": "0x2",
            "validation": { "magicBytes": [ { "offset": 0, "value": 256 } ] },
            "fields": [] })") == Status::DSPEC_INVALID);
    }

    SECTION("Static spec with dynamicFields") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "characteristicUuid": "0x2", "fields": [],
            "dynamicFields": [ { "name": "power", "flagBit": 0, "type": "int16" } ] })") ==
            Status::DSPEC_INVALID);
    }

    SECTION("Divide with three operands") {
        REQUIRE(spec_error(R"({ "id": "x", "name": "x", "serviceUuid": "0x1",
            "characteristicUuid": "0x2", "fields": [],
            "computed": [ { "name": "power", "operation": "divide",
                            "operands": ["cadence", "resistance", "gear"] } ] })") ==
            Status::DSPEC_INVALID);
    }
}

TEST_CASE("DeviceSpec::from_json - Error names spec and field path", "[spec][validation]") {
    auto message = spec_message(R"({ "id": "broken", "name": "x", "serviceUuid": "0x1",
        "characteristicUuid": "0x2",
        "fields": [ { "name": "power", "offset": 0, "type": "uint8" },
                    { "name": "cadence", "offset": -1, "type": "uint8" } ] })");

    REQUIRE(message.find("broken (inline)") != std::string::npos);
    REQUIRE(message.find("fields[1].offset") != std::string::npos);
}

TEST_CASE("DeviceSpec::from_file - File errors", "[spec][file]") {
    SECTION("Missing file") {
        try {
            DeviceSpec::from_file("/tmp/ftmsbridge_no_such_spec.json");
            REQUIRE(false);
        } catch (const ConfigException& e) {
            REQUIRE(e.status() == Status::DNOT_FOUND);
        }
    }

    SECTION("Malformed JSON") {
        TempFile file("/tmp/ftmsbridge_bad_spec.json", "{ \"id\": ");
        try {
            DeviceSpec::from_file(file.path());
            REQUIRE(false);
        } catch (const ConfigException& e) {
            REQUIRE(e.status() == Status::DSPEC_INVALID);
        }
    }
}

TEST_CASE("round_hundredths - Half rounds up", "[spec][transform]") {
    REQUIRE(round_hundredths(28.404) == Catch::Approx(28.40));
    REQUIRE(round_hundredths(2.005001) == Catch::Approx(2.01));
    REQUIRE(round_hundredths(150.0) == Catch::Approx(150.0));

    FieldTransform t;
    t.divisor = 10.0;
    t.multiplier = 1.60934;
    REQUIRE(t.apply(123) == Catch::Approx(19.79));
}
