#include "radnote/geodesy.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace radnote {

namespace {
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}
}  // namespace

double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) noexcept {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double sin_half_lat = std::sin(delta_lat / 2.0);
    const double sin_half_lon = std::sin(delta_lon / 2.0);
    // Clamp so rounding near antipodes cannot push sqrt(1 - a) negative.
    const double a = std::clamp(
        sin_half_lat * sin_half_lat + std::cos(lat1) * std::cos(lat2) * sin_half_lon * sin_half_lon,
        0.0,
        1.0
    );
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

}  // namespace radnote
