#include "radnote/request_router.hpp"

#include <cctype>
#include <cmath>
#include <string>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <fmt/format.h>

#include "radnote/feed_formatter.hpp"
#include "radnote/telemetry_envelope.hpp"
#include "radnote/version.hpp"

namespace radnote {

namespace http = boost::beast::http;

namespace {

constexpr char k_content_text[] = "text/plain";
constexpr char k_content_json[] = "application/json";
constexpr char k_content_feed[] = "application/feed+json";

HttpResponse make_response(const HttpRequest& request, http::status status, const char* content_type, std::string body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, fmt::format("radnote-geofeed/{}", k_version));
    response.set(http::field::content_type, content_type);
    response.keep_alive(false);
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

int hex_value(char character) {
    if (character >= '0' && character <= '9') {
        return character - '0';
    }
    const char lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    if (lowered >= 'a' && lowered <= 'f') {
        return lowered - 'a' + 10;
    }
    return -1;
}

std::string percent_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (std::size_t index = 0; index < encoded.size(); ++index) {
        const char character = encoded[index];
        if (character == '+') {
            decoded.push_back(' ');
            continue;
        }
        if (character == '%' && index + 2 < encoded.size()) {
            const int high = hex_value(encoded[index + 1]);
            const int low = hex_value(encoded[index + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>(high * 16 + low));
                index += 2;
                continue;
            }
        }
        decoded.push_back(character);
    }
    return decoded;
}

/**
 * @brief Numeric value of @p key, or nullopt when absent or empty.
 */
std::optional<double> optional_number(const RequestTarget& target, const std::string& key) {
    const auto iterator_value = target.parameters.find(key);
    if (iterator_value == target.parameters.end() || iterator_value->second.empty()) {
        return std::nullopt;
    }
    const std::string& raw_value = iterator_value->second;
    std::size_t consumed = 0;
    double parsed_value = 0.0;
    try {
        parsed_value = std::stod(raw_value, &consumed);
    } catch (const std::exception&) {
        throw QueryParameterError(fmt::format("query parameter '{}' must be numeric", key));
    }
    if (consumed != raw_value.size() || !std::isfinite(parsed_value)) {
        throw QueryParameterError(fmt::format("query parameter '{}' must be numeric", key));
    }
    return parsed_value;
}

/**
 * @brief Query point, or nullopt unless both coordinates are given and not (0,0).
 */
std::optional<GeodeticCoordinate> query_location(const RequestTarget& target) {
    const std::optional<double> latitude = optional_number(target, "lat");
    const std::optional<double> longitude = optional_number(target, "lon");
    if (!latitude.has_value() || !longitude.has_value()) {
        return std::nullopt;
    }
    const GeodeticCoordinate location{latitude.value(), longitude.value()};
    if (!has_known_location(location)) {
        return std::nullopt;
    }
    return location;
}

}  // namespace

RequestTarget parse_request_target(std::string_view target) {
    RequestTarget parsed{};
    const std::size_t query_start = target.find('?');
    parsed.path = percent_decode(target.substr(0, query_start));
    if (query_start == std::string_view::npos) {
        return parsed;
    }

    std::string_view query = target.substr(query_start + 1);
    while (!query.empty()) {
        const std::size_t separator = query.find('&');
        const std::string_view pair = query.substr(0, separator);
        query = separator == std::string_view::npos ? std::string_view{} : query.substr(separator + 1);
        if (pair.empty()) {
            continue;
        }
        const std::size_t equals = pair.find('=');
        std::string key = percent_decode(pair.substr(0, equals));
        std::string value = equals == std::string_view::npos ? std::string{} : percent_decode(pair.substr(equals + 1));
        parsed.parameters.emplace(std::move(key), std::move(value));
    }
    return parsed;
}

RequestRouter::RequestRouter(DeviceEventStore& store, GeofenceEvaluator& evaluator, RegionAggregator& aggregator)
    : store_(store),
      evaluator_(evaluator),
      aggregator_(aggregator),
      logger_(get_logger()) {}

HttpResponse RequestRouter::handle(const HttpRequest& request) {
    const auto raw_target = request.target();
    try {
        const RequestTarget target = parse_request_target(std::string_view{raw_target.data(), raw_target.size()});
        const http::verb method = request.method();

        if (target.path == "/ping") {
            if (method != http::verb::get) {
                return make_response(request, http::status::method_not_allowed, k_content_text, "method not allowed");
            }
            return make_response(request, http::status::ok, k_content_text, format_rfc3339(SystemClock::now()));
        }
        if (target.path == "/") {
            return make_response(request, http::status::ok, k_content_text, "root");
        }
        if (target.path == "/radnote") {
            if (method == http::verb::post) {
                return handle_ingest(request);
            }
            if (method == http::verb::get) {
                return handle_geofence_query(request, target);
            }
            return make_response(request, http::status::method_not_allowed, k_content_text, "method not allowed");
        }
        if (target.path == "/radiation") {
            if (method == http::verb::get) {
                return handle_radiation_query(request, target);
            }
            return make_response(request, http::status::method_not_allowed, k_content_text, "method not allowed");
        }
        return make_response(request, http::status::not_found, k_content_text, "not found");
    } catch (const QueryParameterError& exc) {
        logger_->warn("Rejected query {}: {}", std::string{raw_target.data(), raw_target.size()}, exc.what());
        return make_response(request, http::status::bad_request, k_content_text, exc.what());
    } catch (const std::exception& exc) {
        logger_->error("Request {} failed: {}", std::string{raw_target.data(), raw_target.size()}, exc.what());
        return make_response(request, http::status::internal_server_error, k_content_text, "internal error");
    }
}

HttpResponse RequestRouter::handle_ingest(const HttpRequest& request) {
    const std::string& body = request.body();
    TelemetryEnvelope envelope;
    try {
        envelope = decode_envelope(body);
    } catch (const EnvelopeDecodeError& exc) {
        logger_->warn("radnote: error decoding POSTed body ({} bytes): {}", body.size(), exc.what());
        return make_response(request, http::status::bad_request, k_content_text, exc.what());
    }

    const bool accepted = store_.record_event(envelope);
    logger_->debug("radnote: {} event from {} ({} bytes) {}",
                   envelope.notefile_kind,
                   envelope.device_id,
                   body.size(),
                   accepted ? "accepted" : "ignored");
    return make_response(request, http::status::ok, k_content_text, "");
}

HttpResponse RequestRouter::handle_geofence_query(const HttpRequest& request, const RequestTarget& target) {
    const std::optional<GeodeticCoordinate> location = query_location(target);
    if (!location.has_value()) {
        return handle_listing(request);
    }
    const GeofenceAdvisory advisory = evaluator_.evaluate(location.value());
    return make_response(request,
                         http::status::ok,
                         k_content_feed,
                         format_geofence_feed(location.value(), advisory, SystemClock::now()));
}

HttpResponse RequestRouter::handle_radiation_query(const HttpRequest& request, const RequestTarget& target) {
    const std::optional<GeodeticCoordinate> location = query_location(target);
    const double radius_m = optional_number(target, "radius_meters").value_or(0.0);
    if (radius_m < 0.0) {
        throw QueryParameterError(fmt::format("query parameter 'radius_meters' must not be negative: {}", radius_m));
    }
    if (!location.has_value()) {
        return handle_listing(request);
    }
    const RegionSummary summary = aggregator_.aggregate(location.value(), radius_m);
    return make_response(request, http::status::ok, k_content_feed, format_region_feed(summary));
}

HttpResponse RequestRouter::handle_listing(const HttpRequest& request) {
    return make_response(request, http::status::ok, k_content_json, format_snapshot_listing(store_.snapshot()));
}

}  // namespace radnote
