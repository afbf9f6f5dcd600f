#pragma once

#include <cstddef>
#include <memory>

#include "radnote/device_event_store.hpp"
#include "radnote/logging.hpp"
#include "radnote/types.hpp"

namespace radnote {

/** @brief Dose-rate statistics for the devices inside a query circle. */
struct RegionSummary final {
    GeodeticCoordinate center{};  /**< Query point. */
    double radius_m{};            /**< Radius actually applied (after defaulting). */
    std::size_t count{};          /**< Located devices within the radius. */
    double usv_min{};             /**< Zero when count is zero. */
    double usv_max{};             /**< Zero when count is zero. */
    double usv_avg{};             /**< Zero when count is zero. */
    TimePoint modified{};         /**< Wall-clock time the summary was computed. */
};

/** @brief Computes count/min/max/average dose rate around a point. */
class RegionAggregator final {
  public:
    /**
     * @param store Source of device records.
     * @param default_radius_m Radius applied when a query passes zero or less.
     */
    RegionAggregator(DeviceEventStore& store, double default_radius_m);

    [[nodiscard]] double default_radius_m() const noexcept;

    /** @brief Aggregate every located device within @p radius_m of @p center. */
    [[nodiscard]] RegionSummary aggregate(const GeodeticCoordinate& center, double radius_m);

  private:
    DeviceEventStore& store_;
    double default_radius_m_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace radnote
