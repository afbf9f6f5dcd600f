// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the geofeed service.
// `ConfigurationLoader` reads alert thresholds from `config.json` in the data
// directory and service knobs from environment variables, so downstream
// modules never touch `std::getenv` or the config file directly.

#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "radnote/geofence_evaluator.hpp"

namespace radnote {

/** @brief Raised when the configuration cannot be loaded. */
class ConfigurationError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Immutable bundle of runtime knobs for the geofeed service.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative.
 */
struct Configuration final {
    std::string log_directory{};              /**< Destination directory for structured logs. */
    std::filesystem::path data_directory{};   /**< Directory holding config.json and the snapshot. */
    std::filesystem::path snapshot_path{};    /**< Persisted device snapshot. */
    std::string http_address{};               /**< Listen address for the HTTP service. */
    std::uint16_t http_port{};                /**< Listen port for the HTTP service. */
    GeofenceConfig geofence{};                /**< Alert thresholds and advisory cadence. */
    double default_query_radius_m{};          /**< Aggregate radius used when a query gives none. */
};

/**
 * @brief Utility responsible for hydrating Configuration from the config file
 *        and environment variables.
 */
class ConfigurationLoader final {
  public:
    /**
     * @brief Load `config.json` from @p data_directory and apply environment overrides.
     *
     * @throws ConfigurationError when the file is missing, unreadable, or not a JSON object.
     */
    static Configuration load(const std::filesystem::path& data_directory);

    /** @brief Data directory named by `RADNOTE_DATA_DIR`, or the default. */
    static std::filesystem::path data_directory_from_environment();

    /** @brief Log directory named by `RADNOTE_LOG_DIR`, or the default. */
    static std::string log_directory_from_environment();

  private:
    static void apply_config_file(const std::filesystem::path& config_path, Configuration& config);
    static std::uint16_t load_http_port();
};

}  // namespace radnote
