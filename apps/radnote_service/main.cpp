#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "radnote/configuration.hpp"
#include "radnote/device_event_store.hpp"
#include "radnote/geofence_evaluator.hpp"
#include "radnote/http_service.hpp"
#include "radnote/logging.hpp"
#include "radnote/region_aggregator.hpp"
#include "radnote/request_router.hpp"
#include "radnote/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace radnote;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load(ConfigurationLoader::data_directory_from_environment());

        if (const char* desired_level = std::getenv("RADNOTE_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        get_logger()->info("radnote geofeed {} starting", k_version);

        DeviceEventStore store{configuration.snapshot_path};
        store.ensure_loaded();
        GeofenceEvaluator evaluator{store, configuration.geofence};
        RegionAggregator aggregator{store, configuration.default_query_radius_m};
        RequestRouter router{store, evaluator, aggregator};

        HttpServiceConfig service_config{};
        service_config.address = configuration.http_address;
        service_config.port = configuration.http_port;
        HttpService service{service_config, router};
        service.start();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        service.stop();
        get_logger()->info("radnote geofeed stopped");
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
