#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "radnote/geodesy.hpp"
#include "radnote/geofence_evaluator.hpp"

using namespace radnote;
using radnote::test::make_radiation_envelope;
using radnote::test::ScopedTempDirectory;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    radnote::test::ensure_logger_initialized();
    return true;
}();

GeofenceConfig make_config() {
    GeofenceConfig config{};
    config.alert_usv = 1.0;
    config.alert_region_m = 1'000.0;
    config.alert_duration_minutes = 60;
    config.alert_sample_minutes = 15;
    config.alert_sync_minutes = 60;
    return config;
}

constexpr GeodeticCoordinate k_hazard_site{35.0, 139.0};
constexpr GeodeticCoordinate k_quiet_site{35.05, 139.0};
constexpr GeodeticCoordinate k_near_hazard{35.004, 139.0};  // ~445 m north of the hazard site
}  // namespace

TEST_CASE("GeofenceEvaluator reports no warning for an empty store") {
    ScopedTempDirectory temp_dir;
    DeviceEventStore store{temp_dir.path() / "rad.json"};
    GeofenceEvaluator evaluator{store, make_config()};

    REQUIRE_FALSE(evaluator.is_location_in_warning_region(k_near_hazard));
}

TEST_CASE("GeofenceEvaluator warns only near a device at or above the threshold") {
    ScopedTempDirectory temp_dir;
    DeviceEventStore store{temp_dir.path() / "rad.json"};
    REQUIRE(store.record_event(make_radiation_envelope("hot", 100, 2.0, k_hazard_site)));
    REQUIRE(store.record_event(make_radiation_envelope("calm", 100, 0.5, k_quiet_site)));
    GeofenceEvaluator evaluator{store, make_config()};

    REQUIRE(evaluator.is_location_in_warning_region(k_near_hazard));
    REQUIRE(evaluator.is_location_in_warning_region(k_hazard_site));
    REQUIRE_FALSE(evaluator.is_location_in_warning_region(k_quiet_site));
}

TEST_CASE("GeofenceEvaluator threshold comparison is inclusive") {
    ScopedTempDirectory temp_dir;
    DeviceEventStore store{temp_dir.path() / "rad.json"};
    REQUIRE(store.record_event(make_radiation_envelope("edge", 100, 1.0, k_hazard_site)));
    GeofenceEvaluator evaluator{store, make_config()};

    REQUIRE(evaluator.is_location_in_warning_region(k_near_hazard));
}

TEST_CASE("GeofenceEvaluator ignores devices without a known location") {
    ScopedTempDirectory temp_dir;
    DeviceEventStore store{temp_dir.path() / "rad.json"};
    REQUIRE(store.record_event(make_radiation_envelope("unlocated", 100, 50.0, GeodeticCoordinate{0.0, 0.0})));
    GeofenceEvaluator evaluator{store, make_config()};

    REQUIRE_FALSE(evaluator.is_location_in_warning_region(GeodeticCoordinate{0.001, 0.001}));
}

TEST_CASE("GeofenceEvaluator advisory carries the alert cadence only while warning") {
    ScopedTempDirectory temp_dir;
    DeviceEventStore store{temp_dir.path() / "rad.json"};
    REQUIRE(store.record_event(make_radiation_envelope("hot", 100, 2.0, k_hazard_site)));
    GeofenceEvaluator evaluator{store, make_config()};

    const GeofenceAdvisory warning = evaluator.evaluate(k_near_hazard);
    REQUIRE(warning.warning);
    REQUIRE(warning.sample_minutes == 15);
    REQUIRE(warning.outbound_minutes == 60);

    const GeofenceAdvisory clear = evaluator.evaluate(k_quiet_site);
    REQUIRE_FALSE(clear.warning);
    REQUIRE(clear.sample_minutes == 0);
    REQUIRE(clear.outbound_minutes == 0);
}

TEST_CASE("GeofenceEvaluator includes a device lying exactly on the alert radius") {
    ScopedTempDirectory temp_dir;
    DeviceEventStore store{temp_dir.path() / "rad.json"};
    REQUIRE(store.record_event(make_radiation_envelope("edge", 100, 2.0, k_hazard_site)));
    GeofenceConfig config = make_config();
    config.alert_region_m = haversine_distance_m(k_hazard_site, k_near_hazard);
    GeofenceEvaluator evaluator{store, config};

    REQUIRE(evaluator.is_location_in_warning_region(k_near_hazard));
}
