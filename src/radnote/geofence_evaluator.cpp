#include "radnote/geofence_evaluator.hpp"

#include "radnote/geodesy.hpp"

namespace radnote {

GeofenceEvaluator::GeofenceEvaluator(DeviceEventStore& store, GeofenceConfig config)
    : store_(store),
      config_(config) {}

const GeofenceConfig& GeofenceEvaluator::config() const noexcept {
    return config_;
}

bool GeofenceEvaluator::is_location_in_warning_region(const GeodeticCoordinate& location) {
    bool in_region = false;
    store_.scan([&](const DeviceRecord& record) {
        if (record.usv < config_.alert_usv || !has_known_location(record.best_location)) {
            return true;
        }
        if (haversine_distance_m(record.best_location, location) <= config_.alert_region_m) {
            in_region = true;
            return false;
        }
        return true;
    });
    return in_region;
}

GeofenceAdvisory GeofenceEvaluator::evaluate(const GeodeticCoordinate& location) {
    GeofenceAdvisory advisory{};
    advisory.warning = is_location_in_warning_region(location);
    if (advisory.warning) {
        advisory.sample_minutes = config_.alert_sample_minutes;
        advisory.outbound_minutes = config_.alert_sync_minutes;
    }
    return advisory;
}

}  // namespace radnote
