/**
 * @file spec_decoder.hpp
 * @brief Generic, spec-driven decoder for inbound BLE characteristic payloads
 * @version 1.0
 * @date 2026-09-17
 *
 * Decoding is pure and stateless per call. Payloads come from untrusted
 * peripherals and unrelated devices may share a vendor characteristic UUID,
 * so rejection is routine traffic filtering: a short, foreign or malformed
 * payload yields an empty MetricRecord, never an exception.
 *
 * Steps:
 * 1. payload shorter than minLength -> empty record
 * 2. magic byte / version checks -> empty record on mismatch
 * 3. static or dynamic field extraction (divisor, multiplier, 2-decimal rounding)
 * 4. computed fields (skipped when any operand is absent)
 * 5. source_type = spec id
 */

#pragma once

#include <cstdint>
#include <string>
#include <boost/core/span.hpp>

#include "metric_record.hpp"
#include "../spec/device_spec.hpp"
#include "../spec/spec_registry.hpp"
#include "../template/result.hpp"

namespace ftmsbridge {

    class SpecDecoder {
        public:
            /**
             * @brief Construct a decoder bound to a registry
             * @param registry Registry that outlives the decoder
             */
            explicit SpecDecoder(const SpecRegistry& registry) : registry_(registry) {}

            /**
             * @brief Look up the spec for a characteristic and decode the payload
             * @return Decoded record, or an empty record when no spec handles the characteristic
             */
            MetricRecord decode(const std::string& characteristic,
                boost::span<const std::uint8_t> payload) const;

            /**
             * @brief Decode a payload with an explicit spec
             */
            static MetricRecord decode(const DeviceSpec& spec,
                boost::span<const std::uint8_t> payload);

            /**
             * @brief Run the length and validation gates only
             * @return Success, or WBAD_LENGTH / WBAD_MAGIC / WBAD_VERSION
             */
            static Result<void> accepts(const DeviceSpec& spec,
                boost::span<const std::uint8_t> payload);

            const SpecRegistry& registry() const { return registry_; }

        private:
            const SpecRegistry& registry_;
    };

} // namespace ftmsbridge
