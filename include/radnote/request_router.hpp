// === Request Router ==========================================================
//
// Maps HTTP requests onto the device event store, geofence evaluator, and
// region aggregator, and maps their outcomes back onto HTTP status codes.
// Independent of sockets so it can be exercised directly.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "radnote/device_event_store.hpp"
#include "radnote/geofence_evaluator.hpp"
#include "radnote/logging.hpp"
#include "radnote/region_aggregator.hpp"

namespace radnote {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/** @brief Raised when a query parameter is present but not numeric. */
class QueryParameterError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Path and decoded query parameters of a request target. */
struct RequestTarget final {
    std::string path{};
    std::map<std::string, std::string> parameters{};
};

/**
 * @brief Split @p target into its path and percent-decoded query parameters.
 *
 * Repeated keys keep their first value.
 */
[[nodiscard]] RequestTarget parse_request_target(std::string_view target);

class RequestRouter final {
  public:
    RequestRouter(DeviceEventStore& store, GeofenceEvaluator& evaluator, RegionAggregator& aggregator);

    /** @brief Produce the response for @p request; never throws. */
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

  private:
    HttpResponse handle_ingest(const HttpRequest& request);
    HttpResponse handle_geofence_query(const HttpRequest& request, const RequestTarget& target);
    HttpResponse handle_radiation_query(const HttpRequest& request, const RequestTarget& target);
    HttpResponse handle_listing(const HttpRequest& request);

    DeviceEventStore& store_;
    GeofenceEvaluator& evaluator_;
    RegionAggregator& aggregator_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace radnote
