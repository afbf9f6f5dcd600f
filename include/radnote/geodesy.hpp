#pragma once

#include "radnote/types.hpp"

namespace radnote {

/** @brief Mean Earth radius used for spherical great-circle math. */
inline constexpr double k_earth_radius_m{6'371'000.0};

/**
 * @brief Determine the great-circle distance separating two coordinates.
 *
 * Uses the haversine formulation, which keeps sub-metre precision where the
 * spherical law of cosines breaks down. Coordinates are not range-checked.
 *
 * @return Distance in metres.
 */
[[nodiscard]] double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) noexcept;

}  // namespace radnote
