#include <fstream>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "radnote/configuration.hpp"

using namespace radnote;
using radnote::test::ScopedTempDirectory;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    radnote::test::ensure_logger_initialized();
    return true;
}();

void write_config(const std::filesystem::path& directory, const char* contents) {
    std::ofstream stream(directory / "config.json");
    stream << contents;
}
}  // namespace

TEST_CASE("ConfigurationLoader reads alert settings from config.json") {
    ScopedTempDirectory temp_dir;
    write_config(temp_dir.path(), R"({
        "radnote_alert_at_usv": 0.8,
        "radnote_alert_region_meters": 2500,
        "radnote_alert_minutes": 90,
        "radnote_alert_sample_minutes": 5,
        "radnote_alert_sync_minutes": 30,
        "radiation_default_radius_meters": 25
    })");

    const Configuration config = ConfigurationLoader::load(temp_dir.path());
    REQUIRE(config.geofence.alert_usv == Approx(0.8));
    REQUIRE(config.geofence.alert_region_m == Approx(2'500.0));
    REQUIRE(config.geofence.alert_duration_minutes == 90);
    REQUIRE(config.geofence.alert_sample_minutes == 5);
    REQUIRE(config.geofence.alert_sync_minutes == 30);
    REQUIRE(config.default_query_radius_m == Approx(25.0));
    REQUIRE(config.snapshot_path == temp_dir.path() / "rad.json");
}

TEST_CASE("ConfigurationLoader falls back to defaults for missing or unusable values") {
    ScopedTempDirectory temp_dir;
    write_config(temp_dir.path(), R"({"radnote_alert_at_usv": -1, "radnote_alert_sample_minutes": "often"})");

    const Configuration config = ConfigurationLoader::load(temp_dir.path());
    REQUIRE(config.geofence.alert_usv == Approx(0.5));
    REQUIRE(config.geofence.alert_region_m == Approx(1'000.0));
    REQUIRE(config.geofence.alert_sample_minutes == 15);
    REQUIRE(config.geofence.alert_sync_minutes == 60);
    REQUIRE(config.default_query_radius_m == Approx(10.0));
}

TEST_CASE("ConfigurationLoader refuses to start without a usable config file") {
    ScopedTempDirectory temp_dir;
    REQUIRE_THROWS_AS(ConfigurationLoader::load(temp_dir.path()), ConfigurationError);

    write_config(temp_dir.path(), "[1, 2]");
    REQUIRE_THROWS_AS(ConfigurationLoader::load(temp_dir.path()), ConfigurationError);

    write_config(temp_dir.path(), "{ broken");
    REQUIRE_THROWS_AS(ConfigurationLoader::load(temp_dir.path()), ConfigurationError);
}
