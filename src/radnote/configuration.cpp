// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of the settings that feed the geofeed
// service. Alert thresholds live in `config.json` inside the data directory
// (the file is required; the service refuses to guess thresholds), while
// service plumbing comes from the environment:
//
// - RADNOTE_DATA_DIR     directory holding config.json and rad.json
// - RADNOTE_LOG_DIR      destination for the rotating log file
// - RADNOTE_HTTP_ADDRESS listen address
// - RADNOTE_HTTP_PORT    listen port
//
// Numeric values that are missing, non-positive, or of the wrong type fall
// back to defaults with a warning.

#include "radnote/configuration.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <string_view>

#include <nlohmann/json.hpp>

#include "radnote/logging.hpp"

namespace radnote {

namespace {
constexpr double k_default_alert_usv{0.5};
constexpr double k_default_alert_region_m{1'000.0};
constexpr int k_default_alert_minutes{60};
constexpr int k_default_alert_sample_minutes{15};
constexpr int k_default_alert_sync_minutes{60};
constexpr double k_default_query_radius_m{10.0};
constexpr std::uint16_t k_default_http_port{8080};
constexpr std::string_view k_default_http_address{"0.0.0.0"};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_data_directory{"data"};
constexpr char k_config_file_name[] = "config.json";
constexpr char k_snapshot_file_name[] = "rad.json";

std::string environment_or(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

double positive_double(const nlohmann::json& document, const char* key, double fallback) {
    const auto iterator_value = document.find(key);
    if (iterator_value == document.end()) {
        return fallback;
    }
    if (!iterator_value->is_number()) {
        get_logger()->warn("Config key {} is not numeric; using fallback {}", key, fallback);
        return fallback;
    }
    const double parsed_value = iterator_value->get<double>();
    return parsed_value <= 0.0 ? fallback : parsed_value;
}

int positive_int(const nlohmann::json& document, const char* key, int fallback) {
    const auto iterator_value = document.find(key);
    if (iterator_value == document.end()) {
        return fallback;
    }
    if (!iterator_value->is_number_integer()) {
        get_logger()->warn("Config key {} is not an integer; using fallback {}", key, fallback);
        return fallback;
    }
    const auto parsed_value = iterator_value->get<std::int64_t>();
    if (parsed_value <= 0 || parsed_value > std::numeric_limits<int>::max()) {
        return fallback;
    }
    return static_cast<int>(parsed_value);
}

}  // namespace

std::filesystem::path ConfigurationLoader::data_directory_from_environment() {
    return std::filesystem::path{environment_or("RADNOTE_DATA_DIR", k_default_data_directory)};
}

std::string ConfigurationLoader::log_directory_from_environment() {
    return environment_or("RADNOTE_LOG_DIR", k_default_log_directory);
}

Configuration ConfigurationLoader::load(const std::filesystem::path& data_directory) {
    Configuration config{};
    config.log_directory = log_directory_from_environment();

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from {}", data_directory.string());

    config.data_directory = data_directory;
    config.snapshot_path = data_directory / k_snapshot_file_name;
    config.http_address = environment_or("RADNOTE_HTTP_ADDRESS", k_default_http_address);
    config.http_port = load_http_port();
    apply_config_file(data_directory / k_config_file_name, config);

    logger->info("Configuration loaded: alert_usv={} alert_region_m={} alert_minutes={} default_radius_m={} listen={}:{}",
                 config.geofence.alert_usv,
                 config.geofence.alert_region_m,
                 config.geofence.alert_duration_minutes,
                 config.default_query_radius_m,
                 config.http_address,
                 config.http_port);
    return config;
}

void ConfigurationLoader::apply_config_file(const std::filesystem::path& config_path, Configuration& config) {
    std::ifstream stream_config(config_path);
    if (!stream_config.is_open()) {
        throw ConfigurationError("Can't load configuration from " + config_path.string());
    }
    const std::string contents{std::istreambuf_iterator<char>(stream_config), std::istreambuf_iterator<char>()};

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(contents);
    } catch (const nlohmann::json::parse_error& exc) {
        throw ConfigurationError("Can't parse " + config_path.string() + ": " + exc.what());
    }
    if (!document.is_object()) {
        throw ConfigurationError(config_path.string() + " must contain a JSON object");
    }

    config.geofence.alert_usv = positive_double(document, "radnote_alert_at_usv", k_default_alert_usv);
    config.geofence.alert_region_m = positive_double(document, "radnote_alert_region_meters", k_default_alert_region_m);
    config.geofence.alert_duration_minutes = positive_int(document, "radnote_alert_minutes", k_default_alert_minutes);
    config.geofence.alert_sample_minutes = positive_int(document, "radnote_alert_sample_minutes", k_default_alert_sample_minutes);
    config.geofence.alert_sync_minutes = positive_int(document, "radnote_alert_sync_minutes", k_default_alert_sync_minutes);
    config.default_query_radius_m = positive_double(document, "radiation_default_radius_meters", k_default_query_radius_m);
}

std::uint16_t ConfigurationLoader::load_http_port() {
    const char* raw_port = std::getenv("RADNOTE_HTTP_PORT");
    if (raw_port == nullptr) {
        return k_default_http_port;
    }
    try {
        const int parsed_port = std::stoi(raw_port);
        if (parsed_port <= 0 || parsed_port > std::numeric_limits<std::uint16_t>::max()) {
            get_logger()->warn("RADNOTE_HTTP_PORT {} out of range; using fallback {}", parsed_port, k_default_http_port);
            return k_default_http_port;
        }
        return static_cast<std::uint16_t>(parsed_port);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse RADNOTE_HTTP_PORT; using fallback {}", k_default_http_port);
        return k_default_http_port;
    }
}

}  // namespace radnote
