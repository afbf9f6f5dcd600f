#include "radnote/telemetry_envelope.hpp"

#include <cstdint>
#include <limits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace radnote {

namespace {

using nlohmann::json;

double read_double(const json& object, const char* key, double fallback) {
    const auto iterator_field = object.find(key);
    if (iterator_field == object.end() || iterator_field->is_null()) {
        return fallback;
    }
    if (!iterator_field->is_number()) {
        throw EnvelopeDecodeError(fmt::format("field '{}' must be numeric", key));
    }
    return iterator_field->get<double>();
}

template <typename Integer>
Integer read_integer(const json& object, const char* key, Integer fallback) {
    const auto iterator_field = object.find(key);
    if (iterator_field == object.end() || iterator_field->is_null()) {
        return fallback;
    }
    if (!iterator_field->is_number_integer()) {
        throw EnvelopeDecodeError(fmt::format("field '{}' must be an integer", key));
    }
    const bool in_range = iterator_field->is_number_unsigned()
        ? iterator_field->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<Integer>::max())
        : iterator_field->get<std::int64_t>() >= static_cast<std::int64_t>(std::numeric_limits<Integer>::min())
              && iterator_field->get<std::int64_t>() <= static_cast<std::int64_t>(std::numeric_limits<Integer>::max());
    if (!in_range) {
        throw EnvelopeDecodeError(fmt::format("field '{}' is out of range: {}", key, iterator_field->dump()));
    }
    return iterator_field->get<Integer>();
}

std::string read_string(const json& object, const char* key) {
    const auto iterator_field = object.find(key);
    if (iterator_field == object.end() || iterator_field->is_null()) {
        return {};
    }
    if (!iterator_field->is_string()) {
        throw EnvelopeDecodeError(fmt::format("field '{}' must be a string", key));
    }
    return iterator_field->get<std::string>();
}

}  // namespace

RadiationReading decode_radiation_reading(const json& body) {
    if (!body.is_object()) {
        throw EnvelopeDecodeError("event body must be a JSON object");
    }
    RadiationReading reading{};
    reading.cpm = read_double(body, "cpm", 0.0);
    reading.cpm_count = read_integer<int>(body, "cpm_count", 0);
    reading.cpm_window_s = read_integer<int>(body, "csecs", 0);
    reading.sensor = read_string(body, "sensor");
    reading.temperature_c = read_double(body, "temperature", 0.0);
    reading.voltage = read_double(body, "voltage", 0.0);
    reading.usv = read_double(body, "usv", 0.0);
    return reading;
}

TelemetryEnvelope decode_envelope(std::string_view raw_json) {
    json document;
    try {
        document = json::parse(raw_json.begin(), raw_json.end());
    } catch (const json::parse_error& exc) {
        throw EnvelopeDecodeError(fmt::format("event is not valid JSON: {}", exc.what()));
    }
    if (!document.is_object()) {
        throw EnvelopeDecodeError("event must be a JSON object");
    }

    TelemetryEnvelope envelope{};
    envelope.device_id = read_string(document, "device");
    if (envelope.device_id.empty()) {
        throw EnvelopeDecodeError("event has no device identifier");
    }
    envelope.occurred_at = read_integer<EpochSeconds>(document, "when", 0);
    envelope.best_location.latitude_deg = read_double(document, "best_lat", 0.0);
    envelope.best_location.longitude_deg = read_double(document, "best_lon", 0.0);
    envelope.notefile_kind = read_string(document, "file");

    const auto iterator_body = document.find("body");
    if (iterator_body != document.end() && !iterator_body->is_null() && envelope.is_radiation_reading()) {
        envelope.reading = decode_radiation_reading(*iterator_body);
    }
    return envelope;
}

void to_json(json& json_out, const RadiationReading& reading) {
    json_out = json{
        {"cpm", reading.cpm},
        {"cpm_count", reading.cpm_count},
        {"csecs", reading.cpm_window_s},
        {"sensor", reading.sensor},
        {"temperature", reading.temperature_c},
        {"voltage", reading.voltage},
        {"usv", reading.usv},
    };
}

}  // namespace radnote
