#include <string>

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "radnote/request_router.hpp"

using namespace radnote;
using radnote::test::make_radiation_envelope;
using radnote::test::ScopedTempDirectory;
namespace http = boost::beast::http;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    radnote::test::ensure_logger_initialized();
    return true;
}();

HttpRequest make_request(http::verb method, const std::string& target, std::string body = {}) {
    HttpRequest request{method, target, 11};
    request.body() = std::move(body);
    request.prepare_payload();
    return request;
}

/** @brief Store, query components, and router wired against a temp snapshot. */
struct RouterHarness final {
    ScopedTempDirectory temp_dir{};
    DeviceEventStore store{temp_dir.path() / "rad.json"};
    GeofenceEvaluator evaluator{store, GeofenceConfig{1.0, 1'000.0, 60, 15, 60}};
    RegionAggregator aggregator{store, 10.0};
    RequestRouter router{store, evaluator, aggregator};
};

nlohmann::json feed_content(const HttpResponse& response) {
    const nlohmann::json feed = nlohmann::json::parse(response.body());
    return nlohmann::json::parse(feed.at("items").at(0).at("content_text").get<std::string>());
}
}  // namespace

TEST_CASE("parse_request_target splits and decodes query parameters") {
    const RequestTarget target = parse_request_target("/radiation?lat=35.1&lon=%2D139.5&name=a+b&flag");
    REQUIRE(target.path == "/radiation");
    REQUIRE(target.parameters.at("lat") == "35.1");
    REQUIRE(target.parameters.at("lon") == "-139.5");
    REQUIRE(target.parameters.at("name") == "a b");
    REQUIRE(target.parameters.at("flag").empty());
}

TEST_CASE("RequestRouter stores POSTed radiation events") {
    RouterHarness harness;
    const HttpResponse response = harness.router.handle(make_request(
        http::verb::post,
        "/radnote",
        R"({"device": "dev:1", "file": "_air.qo", "when": 10, "best_lat": 35.0, "best_lon": 139.0, "body": {"usv": 2.5}})"
    ));

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(harness.store.snapshot().at("dev:1").usv == Approx(2.5));
}

TEST_CASE("RequestRouter acknowledges irrelevant events without storing them") {
    RouterHarness harness;
    const HttpResponse response = harness.router.handle(
        make_request(http::verb::post, "/radnote", R"({"device": "dev:1", "file": "_health.qo", "when": 10})")
    );

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(harness.store.size() == 0);
}

TEST_CASE("RequestRouter rejects malformed envelopes with 400") {
    RouterHarness harness;
    const HttpResponse response = harness.router.handle(make_request(http::verb::post, "/radnote", "{oops"));

    REQUIRE(response.result() == http::status::bad_request);
    REQUIRE_FALSE(response.body().empty());
    REQUIRE(harness.store.size() == 0);
}

TEST_CASE("RequestRouter answers geofence queries with an advisory feed") {
    RouterHarness harness;
    REQUIRE(harness.store.record_event(make_radiation_envelope("hot", 10, 3.0, GeodeticCoordinate{35.0, 139.0})));

    const HttpResponse near_response = harness.router.handle(make_request(http::verb::get, "/radnote?lat=35.001&lon=139.0"));
    REQUIRE(near_response.result() == http::status::ok);
    REQUIRE(feed_content(near_response).at("warning").get<bool>());

    const HttpResponse far_response = harness.router.handle(make_request(http::verb::get, "/radnote?lat=36.0&lon=139.0"));
    REQUIRE_FALSE(feed_content(far_response).at("warning").get<bool>());
}

TEST_CASE("RequestRouter answers radiation queries with an aggregate feed") {
    RouterHarness harness;
    REQUIRE(harness.store.record_event(make_radiation_envelope("a", 10, 1.0, GeodeticCoordinate{35.0, 139.0})));
    REQUIRE(harness.store.record_event(make_radiation_envelope("b", 10, 3.0, GeodeticCoordinate{35.0001, 139.0})));

    const HttpResponse response = harness.router.handle(
        make_request(http::verb::get, "/radiation?lat=35.0&lon=139.0&radius_meters=100")
    );
    REQUIRE(response.result() == http::status::ok);
    const nlohmann::json content = feed_content(response);
    REQUIRE(content.at("count").get<int>() == 2);
    REQUIRE(content.at("usv_avg").get<double>() == Approx(2.0));

    const HttpResponse defaulted = harness.router.handle(make_request(http::verb::get, "/radiation?lat=35.0&lon=139.0"));
    REQUIRE(feed_content(defaulted).at("radius_meters").get<double>() == Approx(10.0));
    REQUIRE(feed_content(defaulted).at("count").get<int>() == 1);
}

TEST_CASE("RequestRouter lists the snapshot when no usable location is given") {
    RouterHarness harness;
    REQUIRE(harness.store.record_event(make_radiation_envelope("a", 10, 1.0, GeodeticCoordinate{35.0, 139.0})));

    for (const char* target : {"/radiation", "/radnote", "/radnote?lat=0&lon=0", "/radiation?lat=35.0"}) {
        const HttpResponse response = harness.router.handle(make_request(http::verb::get, target));
        REQUIRE(response.result() == http::status::ok);
        REQUIRE(nlohmann::json::parse(response.body()).contains("a"));
    }
}

TEST_CASE("RequestRouter rejects non-numeric or negative query parameters with 400") {
    RouterHarness harness;
    REQUIRE(harness.router.handle(make_request(http::verb::get, "/radiation?lat=abc&lon=139")).result()
            == http::status::bad_request);
    REQUIRE(harness.router.handle(make_request(http::verb::get, "/radiation?lat=35&lon=139&radius_meters=wide")).result()
            == http::status::bad_request);
    REQUIRE(harness.router.handle(make_request(http::verb::get, "/radiation?lat=35&lon=139&radius_meters=-5")).result()
            == http::status::bad_request);
    REQUIRE(harness.router.handle(make_request(http::verb::get, "/radnote?lat=35x&lon=139")).result()
            == http::status::bad_request);
}

TEST_CASE("RequestRouter serves health endpoints and rejects unknown routes") {
    RouterHarness harness;

    const HttpResponse ping = harness.router.handle(make_request(http::verb::get, "/ping"));
    REQUIRE(ping.result() == http::status::ok);
    REQUIRE(ping.body().size() == std::string{"2024-01-01T00:00:00Z"}.size());
    REQUIRE(ping.body().back() == 'Z');

    REQUIRE(harness.router.handle(make_request(http::verb::get, "/")).body() == "root");
    REQUIRE(harness.router.handle(make_request(http::verb::get, "/elsewhere")).result() == http::status::not_found);
    REQUIRE(harness.router.handle(make_request(http::verb::put, "/radnote")).result() == http::status::method_not_allowed);
    REQUIRE(harness.router.handle(make_request(http::verb::post, "/radiation")).result() == http::status::method_not_allowed);
}
