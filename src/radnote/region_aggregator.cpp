#include "radnote/region_aggregator.hpp"

#include <algorithm>

#include "radnote/geodesy.hpp"

namespace radnote {

RegionAggregator::RegionAggregator(DeviceEventStore& store, double default_radius_m)
    : store_(store),
      default_radius_m_(default_radius_m),
      logger_(get_logger()) {}

double RegionAggregator::default_radius_m() const noexcept {
    return default_radius_m_;
}

RegionSummary RegionAggregator::aggregate(const GeodeticCoordinate& center, double radius_m) {
    RegionSummary summary{};
    summary.center = center;
    summary.radius_m = radius_m == 0.0 ? default_radius_m_ : radius_m;

    double sum_usv = 0.0;
    store_.scan([&](const DeviceRecord& record) {
        if (!has_known_location(record.best_location)) {
            return true;
        }
        if (haversine_distance_m(record.best_location, center) > summary.radius_m) {
            return true;
        }
        if (summary.count == 0) {
            summary.usv_min = record.usv;
            summary.usv_max = record.usv;
        } else {
            summary.usv_min = std::min(summary.usv_min, record.usv);
            summary.usv_max = std::max(summary.usv_max, record.usv);
        }
        sum_usv += record.usv;
        ++summary.count;
        return true;
    });

    if (summary.count > 0) {
        summary.usv_avg = sum_usv / static_cast<double>(summary.count);
    } else {
        logger_->debug("No devices within {} m of {},{}", summary.radius_m, center.latitude_deg, center.longitude_deg);
    }
    summary.modified = SystemClock::now();
    return summary;
}

}  // namespace radnote
