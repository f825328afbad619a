#include <doctest/doctest.h>
#include "rtlslink/heartbeat.hpp"

#include <nlohmann/json.hpp>

using namespace rtlslink;

TEST_CASE("full tag heartbeat decodes every field") {
    const std::string hb = R"({
        "id":"tag-7","role":"tag_tdoa","mac":"AA:BB:CC:DD:EE:01","uwb_short":"7",
        "mav_sysid":2,"fw":"1.4.2","sending_pos":true,"anchors_seen":4,
        "origin_sent":true,"rf_enabled":true,"rf_healthy":false,
        "avg_rate_cHz":1000,"min_rate_cHz":950,"max_rate_cHz":1040,
        "log_level":3,"log_udp_port":3334,"log_serial_enabled":true,"log_udp_enabled":false,
        "dyn_anchors":[{"id":1,"x":0.0,"y":0.0,"z":1.5},{"id":2,"x":3.0,"y":0.5,"z":1.5}]
    })";

    auto r = parse_heartbeat(hb, "192.168.1.40");
    REQUIRE(r.ok());
    const Device& d = r.value();
    CHECK(d.ip == "192.168.1.40");
    CHECK(d.id == "tag-7");
    CHECK(d.role == DeviceRole::TagTdoa);
    CHECK(d.mac == "AA:BB:CC:DD:EE:01");
    CHECK(d.uwb_short == "7");
    CHECK(d.mav_sys_id == 2);
    CHECK(d.firmware == "1.4.2");
    CHECK(d.sending_pos == true);
    CHECK(d.anchors_seen == 4);
    CHECK(d.rf_healthy == false);
    CHECK(d.avg_rate_chz == 1000);
    CHECK(d.max_rate_chz == 1040);
    CHECK(d.log_udp_port == 3334);
    CHECK(d.log_udp_enabled == false);
    REQUIRE(d.dynamic_anchors.has_value());
    REQUIRE(d.dynamic_anchors->size() == 2);
    CHECK((*d.dynamic_anchors)[1].id == 2);
    CHECK((*d.dynamic_anchors)[1].y == doctest::Approx(0.5));
}

TEST_CASE("heartbeat without telemetry leaves optional fields absent") {
    auto r = parse_heartbeat(R"({"id":"a1","role":"anchor","mac":"m","uwb_short":"1","mav_sysid":1,"fw":"1.0"})",
                             "10.0.0.2");
    REQUIRE(r.ok());
    const Device& d = r.value();
    CHECK(d.role == DeviceRole::Anchor);
    CHECK_FALSE(d.sending_pos.has_value());
    CHECK_FALSE(d.anchors_seen.has_value());
    CHECK_FALSE(d.avg_rate_chz.has_value());
    CHECK_FALSE(d.log_level.has_value());
    CHECK_FALSE(d.dynamic_anchors.has_value());
}

TEST_CASE("missing required fields default and unknown role is not an error") {
    auto r = parse_heartbeat(R"({"role":"repeater"})", "10.0.0.3");
    REQUIRE(r.ok());
    CHECK(r.value().id.empty());
    CHECK(r.value().firmware.empty());
    CHECK(r.value().mav_sys_id == 0);
    CHECK(r.value().role == DeviceRole::Unknown);
}

TEST_CASE("wrong-typed optional fields are treated as absent") {
    auto r = parse_heartbeat(R"({"id":"t","role":"tag","sending_pos":"yes","anchors_seen":-1,
                                  "avg_rate_cHz":70000,"rf_enabled":null})", "10.0.0.4");
    REQUIRE(r.ok());
    CHECK_FALSE(r.value().sending_pos.has_value());
    CHECK_FALSE(r.value().anchors_seen.has_value());
    CHECK_FALSE(r.value().avg_rate_chz.has_value());
    CHECK_FALSE(r.value().rf_enabled.has_value());
}

TEST_CASE("incomplete dyn_anchors entries are skipped one by one") {
    auto r = parse_heartbeat(R"({"role":"tag_tdoa","dyn_anchors":[{"id":1,"x":1,"y":2,"z":3},{"id":2,"x":1}]})",
                             "10.0.0.5");
    REQUIRE(r.ok());
    REQUIRE(r.value().dynamic_anchors.has_value());
    CHECK(r.value().dynamic_anchors->size() == 1);
}

TEST_CASE("non-JSON and non-object payloads are decode errors") {
    auto bad = parse_heartbeat("not json", "10.0.0.6");
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().kind == ErrorKind::Decode);
    CHECK(bad.error().ip == "10.0.0.6");

    auto arr = parse_heartbeat("[1,2,3]", "10.0.0.6");
    REQUIRE_FALSE(arr.ok());
    CHECK(arr.error().kind == ErrorKind::Decode);
}

TEST_CASE("device JSON output omits absent telemetry") {
    auto r = parse_heartbeat(R"({"id":"t","role":"tag","anchors_seen":2})", "10.0.0.7");
    REQUIRE(r.ok());
    nlohmann::json j = r.value();
    CHECK(j["ip"] == "10.0.0.7");
    CHECK(j["role"] == "tag");
    CHECK(j["anchorsSeen"] == 2);
    CHECK_FALSE(j.contains("sendingPos"));
    CHECK_FALSE(j.contains("dynamicAnchors"));
}
