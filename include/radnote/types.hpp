// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// geofeed service (wall-clock primitives, geodetic coordinates).

#pragma once

#include <chrono>
#include <cstdint>

namespace radnote {

/**
 * @brief Alias for the wall clock used to stamp query results.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = std::chrono::time_point<SystemClock>;

/**
 * @brief Device-assigned event time, in seconds since the Unix epoch.
 */
using EpochSeconds = std::int64_t;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief True unless the coordinate is the (0,0) "no location reported" sentinel.
 */
[[nodiscard]] constexpr bool has_known_location(const GeodeticCoordinate& coordinate) noexcept {
    return coordinate.latitude_deg != 0.0 || coordinate.longitude_deg != 0.0;
}

}  // namespace radnote
