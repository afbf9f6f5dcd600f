#include "radnote/device_record.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace radnote {

DeviceRecord make_device_record(const TelemetryEnvelope& envelope) {
    DeviceRecord record{};
    record.device_id = envelope.device_id;
    record.occurred_at = envelope.occurred_at;
    record.best_location = envelope.best_location;
    record.notefile_kind = envelope.notefile_kind;
    if (envelope.reading.has_value()) {
        record.reading = envelope.reading.value();
        record.usv = record.reading.usv;
    }
    return record;
}

void to_json(nlohmann::json& json_out, const DeviceRecord& record) {
    json_out = nlohmann::json{
        {"event",
         {
             {"device", record.device_id},
             {"when", record.occurred_at},
             {"file", record.notefile_kind},
             {"best_lat", record.best_location.latitude_deg},
             {"best_lon", record.best_location.longitude_deg},
         }},
        {"usv", record.usv},
        {"body", record.reading},
    };
}

void from_json(const nlohmann::json& json_in, DeviceRecord& record) {
    const nlohmann::json& event = json_in.at("event");
    record.device_id = event.value("device", record.device_id);
    record.occurred_at = event.value("when", EpochSeconds{0});
    record.notefile_kind = event.value("file", std::string{});
    record.best_location.latitude_deg = event.value("best_lat", 0.0);
    record.best_location.longitude_deg = event.value("best_lon", 0.0);
    record.usv = json_in.value("usv", 0.0);

    const auto iterator_body = json_in.find("body");
    if (iterator_body != json_in.end() && !iterator_body->is_null()) {
        record.reading = decode_radiation_reading(*iterator_body);
    }
    record.reading.usv = record.usv;
}

nlohmann::json records_to_json(const DeviceRecordMap& records) {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& [device_id, record] : records) {
        document[device_id] = record;
    }
    return document;
}

DeviceRecordMap records_from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("snapshot must be a JSON object");
    }
    DeviceRecordMap records;
    records.reserve(document.size());
    for (const auto& [device_id, json_record] : document.items()) {
        DeviceRecord record{};
        from_json(json_record, record);
        record.device_id = device_id;
        records.emplace(device_id, std::move(record));
    }
    return records;
}

}  // namespace radnote
