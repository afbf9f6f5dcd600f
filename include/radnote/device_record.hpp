#pragma once

#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

#include "radnote/telemetry_envelope.hpp"
#include "radnote/types.hpp"

namespace radnote {

/**
 * @brief Latest known state retained for one device.
 */
struct DeviceRecord final {
    std::string device_id{};             /**< Unique key of the record. */
    EpochSeconds occurred_at{};          /**< Device timestamp of the retained reading. */
    GeodeticCoordinate best_location{};  /**< (0,0) when the device has not reported a location. */
    std::string notefile_kind{};         /**< Kind of the accepted envelope. */
    double usv{};                        /**< Dose rate in µSv/h. */
    RadiationReading reading{};          /**< Full radiation body as last reported. */
};

/** @brief Snapshot mapping of device identifier to its record. */
using DeviceRecordMap = std::unordered_map<std::string, DeviceRecord>;

/** @brief Build the record retained for an accepted envelope. */
[[nodiscard]] DeviceRecord make_device_record(const TelemetryEnvelope& envelope);

void to_json(nlohmann::json& json_out, const DeviceRecord& record);

/** @brief Rebuild a record from its persisted form. */
void from_json(const nlohmann::json& json_in, DeviceRecord& record);

/** @brief Snapshot document: one member per device, keyed by identifier. */
[[nodiscard]] nlohmann::json records_to_json(const DeviceRecordMap& records);

/**
 * @brief Rebuild a snapshot document; the member key wins over any nested device id.
 *
 * @throws std::exception when the document is not an object of records.
 */
[[nodiscard]] DeviceRecordMap records_from_json(const nlohmann::json& document);

}  // namespace radnote
