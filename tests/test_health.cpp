#include <doctest/doctest.h>
#include "rtlslink/health.hpp"

using namespace rtlslink;

static Device tag() {
    Device d;
    d.ip = "10.0.0.5";
    d.role = DeviceRole::TagTdoa;
    return d;
}

TEST_CASE("anchors are always healthy") {
    Device d;
    d.role = DeviceRole::AnchorTdoa;
    auto h = calculate_device_health(d);
    CHECK(h.level == HealthLevel::Healthy);
    CHECK(h.issues.empty());
}

TEST_CASE("tag without telemetry is unknown") {
    auto h = calculate_device_health(tag());
    CHECK(h.level == HealthLevel::Unknown);
    REQUIRE(h.issues.size() == 1);
    CHECK(h.issues[0] == "No telemetry data");
}

TEST_CASE("tag with full telemetry is healthy") {
    Device d = tag();
    d.sending_pos = true;
    d.anchors_seen = 4;
    d.origin_sent = true;
    d.rf_enabled = true;
    d.rf_healthy = true;
    auto h = calculate_device_health(d);
    CHECK(h.level == HealthLevel::Healthy);
    CHECK(h.issues.empty());
}

TEST_CASE("not sending positions or too few anchors degrades") {
    Device d = tag();
    d.sending_pos = false;
    d.anchors_seen = 1;
    auto h = calculate_device_health(d);
    CHECK(h.level == HealthLevel::Degraded);
    REQUIRE(h.issues.size() == 2);
    CHECK(h.issues[0] == "Not sending positions");
    CHECK(h.issues[1] == "Only seeing 1 anchor");

    Device e = tag();
    e.anchors_seen = 2;
    auto h2 = calculate_device_health(e);
    CHECK(h2.level == HealthLevel::Degraded);
    CHECK(h2.issues[0] == "Only seeing 2 anchors");
}

TEST_CASE("origin and rangefinder problems only warn") {
    Device d = tag();
    d.sending_pos = true;
    d.origin_sent = false;
    d.rf_enabled = true;
    d.rf_healthy = false;
    auto h = calculate_device_health(d);
    CHECK(h.level == HealthLevel::Warning);
    REQUIRE(h.issues.size() == 2);
    CHECK(h.issues[0] == "Origin not sent to autopilot");
    CHECK(h.issues[1] == "Rangefinder unhealthy");
}

TEST_CASE("unhealthy rangefinder is ignored when disabled") {
    Device d = tag();
    d.rf_enabled = false;
    d.rf_healthy = false;
    CHECK(calculate_device_health(d).level == HealthLevel::Healthy);
}

TEST_CASE("health level names") {
    CHECK(std::string(to_string(HealthLevel::Degraded)) == "degraded");
    CHECK(std::string(to_string(HealthLevel::Unknown)) == "unknown");
}
