#include "radnote/feed_formatter.hpp"

#include <chrono>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace radnote {

namespace {
constexpr char k_feed_version[] = "https://jsonfeed.org/version/1";
constexpr char k_feed_base_url[] = "https://geofeeds.net/radnote/";
constexpr char k_region_item_id[] = "region";
constexpr char k_geofence_item_id[] = "1";

std::string feed_url(const GeodeticCoordinate& location) {
    return fmt::format("{}?lat={:f}&lon={:f}", k_feed_base_url, location.latitude_deg, location.longitude_deg);
}

std::string item_url(const char* item_id, const GeodeticCoordinate& location) {
    return fmt::format("{}{}?lat={:f}&lon={:f}", k_feed_base_url, item_id, location.latitude_deg, location.longitude_deg);
}
}  // namespace

std::string format_rfc3339(TimePoint time_point) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(SystemClock::to_time_t(time_point)));
}

nlohmann::json region_content(const RegionSummary& summary) {
    return nlohmann::json{
        {"lat", summary.center.latitude_deg},
        {"lon", summary.center.longitude_deg},
        {"radius_meters", summary.radius_m},
        {"count", summary.count},
        {"usv_min", summary.usv_min},
        {"usv_max", summary.usv_max},
        {"usv_avg", summary.usv_avg},
        {"modified", std::chrono::duration_cast<std::chrono::seconds>(summary.modified.time_since_epoch()).count()},
    };
}

nlohmann::json advisory_content(const GeofenceAdvisory& advisory) {
    nlohmann::json content{{"warning", advisory.warning}};
    if (advisory.warning) {
        content["sample_mins"] = advisory.sample_minutes;
        content["outbound_mins"] = advisory.outbound_minutes;
    }
    return content;
}

std::string format_region_feed(const RegionSummary& summary) {
    const std::string published = format_rfc3339(summary.modified);
    nlohmann::json item{
        {"id", k_region_item_id},
        {"url", item_url(k_region_item_id, summary.center)},
        {"content_text", region_content(summary).dump()},
        {"date_published", published},
        {"date_modified", published},
    };
    nlohmann::json feed{
        {"version", k_feed_version},
        {"title", fmt::format("radnote geofeed for {:f},{:f}", summary.center.latitude_deg, summary.center.longitude_deg)},
        {"feed_url", feed_url(summary.center)},
        {"items", nlohmann::json::array({std::move(item)})},
    };
    return feed.dump();
}

std::string format_geofence_feed(const GeodeticCoordinate& location, const GeofenceAdvisory& advisory, TimePoint published) {
    nlohmann::json item{
        {"id", k_geofence_item_id},
        {"url", item_url(k_geofence_item_id, location)},
        {"content_text", advisory_content(advisory).dump()},
        {"date_published", format_rfc3339(published)},
    };
    nlohmann::json feed{
        {"version", k_feed_version},
        {"feed_url", feed_url(location)},
        {"items", nlohmann::json::array({std::move(item)})},
    };
    return feed.dump();
}

std::string format_snapshot_listing(const DeviceRecordMap& records) {
    return records_to_json(records).dump(4);
}

}  // namespace radnote
