// === Feed Formatter ==========================================================
//
// Wraps query results in JSON Feed v1 documents so map clients that poll
// geofeeds can consume them, and renders the raw snapshot listing.

#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "radnote/device_record.hpp"
#include "radnote/geofence_evaluator.hpp"
#include "radnote/region_aggregator.hpp"
#include "radnote/types.hpp"

namespace radnote {

/** @brief Format @p time_point as RFC 3339 UTC with second precision. */
[[nodiscard]] std::string format_rfc3339(TimePoint time_point);

/** @brief Item content for an aggregate query. */
[[nodiscard]] nlohmann::json region_content(const RegionSummary& summary);

/** @brief Item content for a geofence query. */
[[nodiscard]] nlohmann::json advisory_content(const GeofenceAdvisory& advisory);

/** @brief JSON Feed carrying one `region` item with the aggregate statistics. */
[[nodiscard]] std::string format_region_feed(const RegionSummary& summary);

/** @brief JSON Feed carrying one item with the geofence advisory. */
[[nodiscard]] std::string format_geofence_feed(const GeodeticCoordinate& location,
                                               const GeofenceAdvisory& advisory,
                                               TimePoint published);

/** @brief Full snapshot, pretty-printed, keyed by device identifier. */
[[nodiscard]] std::string format_snapshot_listing(const DeviceRecordMap& records);

}  // namespace radnote
