// === Telemetry Envelope ======================================================
//
// Typed view of the event envelope a Notehub route POSTs to the service, plus
// the radiation payload carried by `_air.qo` notes. Decoding turns a raw JSON
// body into these structures; anything the store does not interpret is
// discarded here.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "radnote/types.hpp"

namespace radnote {

/** @brief Notefile kind carrying radiation readings; all other kinds are ignored. */
inline constexpr std::string_view k_radiation_notefile{"_air.qo"};

/** @brief Raised when an inbound envelope cannot be decoded. */
class EnvelopeDecodeError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Radiation fields reported in the body of an `_air.qo` note. */
struct RadiationReading final {
    double cpm{};            /**< Counts per minute. */
    int cpm_count{};         /**< Raw count in the sampling window. */
    int cpm_window_s{};      /**< Length of the sampling window in seconds. */
    std::string sensor{};    /**< Sensor tube identifier. */
    double temperature_c{};  /**< Board temperature in °C. */
    double voltage{};        /**< Supply voltage. */
    double usv{};            /**< Dose rate in µSv/h. */
};

/** @brief Decoded event envelope handed to the device event store. */
struct TelemetryEnvelope final {
    std::string device_id{};
    EpochSeconds occurred_at{};
    GeodeticCoordinate best_location{};
    std::string notefile_kind{};
    std::optional<RadiationReading> reading{}; /**< Present when the envelope carried a body. */

    [[nodiscard]] bool is_radiation_reading() const noexcept {
        return notefile_kind == k_radiation_notefile;
    }
};

/**
 * @brief Decode a JSON envelope.
 *
 * @throws EnvelopeDecodeError when the text is not JSON, is not an object,
 *         lacks a device identifier, or a known field has the wrong type.
 */
[[nodiscard]] TelemetryEnvelope decode_envelope(std::string_view raw_json);

/**
 * @brief Extract radiation fields from an envelope body.
 *
 * Absent fields default to zero or empty.
 *
 * @throws EnvelopeDecodeError when @p body is not an object or a field has the wrong type.
 */
[[nodiscard]] RadiationReading decode_radiation_reading(const nlohmann::json& body);

void to_json(nlohmann::json& json_out, const RadiationReading& reading);

}  // namespace radnote
