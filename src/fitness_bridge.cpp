/**
 * @file fitness_bridge.cpp
 * @brief FitnessBridge implementation
 * @version 1.0
 * @date 2026-09-23
 */

#include "pattern/fitness_bridge.hpp"
#include "encoder/ftms_encoder.hpp"
#include "ftms/gatt_uuids.hpp"

#include <iostream>

namespace ftmsbridge {

    FitnessBridge::FitnessBridge(const BridgeConfig& config,
        const SpecRegistry& registry,
        IBleTransport& transport)
        : config_(config),
        registry_(registry),
        transport_(transport),
        control_point_(config.enforce_control),
        broadcaster_(config_, store_, transport) {
        if (registry_.empty()) {
            std::cerr << "[FitnessBridge] Warning: no device specs loaded" << std::endl;
        }
    }

    FitnessBridge::~FitnessBridge() {
        try {
            stop();
        } catch (const std::exception& e) {
            std::cerr << "[FitnessBridge] Error stopping in destructor: " << e.what() << std::endl;
        }
    }

    SpecRegistry FitnessBridge::load_registry(const BridgeConfig& config) {
        SpecRegistry registry(config.allow_duplicate_characteristics ? DuplicatePolicy::LAST_WINS
                                                                     : DuplicatePolicy::REJECT);
        registry.load_directory(config.spec_directory);
        return registry;
    }

    // === Inbound ===

    MetricRecord FitnessBridge::on_characteristic_value(const std::string& characteristic,
        boost::span<const std::uint8_t> value) {
        stats_.values_received.fetch_add(1, std::memory_order_relaxed);

        const DeviceSpec* spec = registry_.lookup(characteristic);
        if (spec == nullptr) {
            stats_.unknown_characteristics.fetch_add(1, std::memory_order_relaxed);
            return MetricRecord{};
        }

        MetricRecord record = SpecDecoder::decode(*spec, value);
        if (record.empty()) {
            stats_.values_rejected.fetch_add(1, std::memory_order_relaxed);
            return record;
        }

        stats_.values_decoded.fetch_add(1, std::memory_order_relaxed);
        store_.merge(record);
        return record;
    }

    Result<ControlPointResponse> FitnessBridge::on_control_point_write(
        boost::span<const std::uint8_t> request) {
        auto result = control_point_.handle(request);
        if (!result) {
            return Result<ControlPointResponse>::error(result, "on_control_point_write");
        }
        stats_.control_writes.fetch_add(1, std::memory_order_relaxed);

        if (transport_.has_subscribers(gatt::FITNESS_MACHINE_CONTROL_POINT)) {
            const auto bytes = result.value().to_bytes();
            if (!transport_.indicate(gatt::FITNESS_MACHINE_CONTROL_POINT, bytes)) {
                std::cerr << "[FitnessBridge] Control point indication failed" << std::endl;
            }
        }
        return result;
    }

    // === Lifecycle ===

    void FitnessBridge::start() {
        broadcaster_.start();
    }

    void FitnessBridge::stop() {
        broadcaster_.stop();
    }

    // === Readable characteristic values ===

    std::array<std::uint8_t, 8> FitnessBridge::fitness_machine_feature() const {
        return encode_fitness_machine_feature(config_.output_profile,
                   config_.advertise_target_settings);
    }

    std::array<std::uint8_t, 6> FitnessBridge::supported_power_range() const {
        return encode_supported_power_range(config_.power_range);
    }

    std::array<std::uint8_t, 6> FitnessBridge::supported_resistance_range() const {
        return encode_supported_resistance_range(config_.resistance_range);
    }

    // === Statistics ===

    BridgeStatisticsSnapshot FitnessBridge::get_statistics() const {
        BridgeStatisticsSnapshot snapshot;
        snapshot.values_received = stats_.values_received.load(std::memory_order_relaxed);
        snapshot.values_decoded = stats_.values_decoded.load(std::memory_order_relaxed);
        snapshot.values_rejected = stats_.values_rejected.load(std::memory_order_relaxed);
        snapshot.unknown_characteristics =
            stats_.unknown_characteristics.load(std::memory_order_relaxed);
        snapshot.control_writes = stats_.control_writes.load(std::memory_order_relaxed);
        return snapshot;
    }

    void FitnessBridge::reset_statistics() {
        stats_.reset();
    }

} // namespace ftmsbridge
