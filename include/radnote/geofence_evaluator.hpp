// === Geofence Evaluator ======================================================
//
// Answers "is this location inside a hazard region?" by scanning the device
// event store for a located device reporting a dose rate at or above the alert
// threshold within the alert radius of the query point.

#pragma once

#include "radnote/device_event_store.hpp"
#include "radnote/types.hpp"

namespace radnote {

/**
 * @brief Alert thresholds and the advisory sampling cadence sent to devices.
 */
struct GeofenceConfig final {
    double alert_usv{};               /**< Dose rate (µSv/h) at or above which a device is hazardous. */
    double alert_region_m{};          /**< Radius around a hazardous device that is in alert. */
    int alert_duration_minutes{};     /**< How long an alert stays active. */
    int alert_sample_minutes{};       /**< Sample period advised while an alert is active. */
    int alert_sync_minutes{};         /**< Outbound sync period advised while an alert is active. */
};

/** @brief Result of a geofence check with the advised device cadence. */
struct GeofenceAdvisory final {
    bool warning{};
    int sample_minutes{};   /**< Meaningful only when warning is set. */
    int outbound_minutes{}; /**< Meaningful only when warning is set. */
};

class GeofenceEvaluator final {
  public:
    GeofenceEvaluator(DeviceEventStore& store, GeofenceConfig config);

    [[nodiscard]] const GeofenceConfig& config() const noexcept;

    /** @brief True when any located hazardous device is within the alert radius of @p location. */
    [[nodiscard]] bool is_location_in_warning_region(const GeodeticCoordinate& location);

    /** @brief Run the warning-region check and attach the advisory cadence. */
    [[nodiscard]] GeofenceAdvisory evaluate(const GeodeticCoordinate& location);

  private:
    DeviceEventStore& store_;
    GeofenceConfig config_;
};

}  // namespace radnote
