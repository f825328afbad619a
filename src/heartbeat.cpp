// ============================================================================
// heartbeat.cpp - implementation for heartbeat.hpp
// For the wire key list see the header. Fixtures live in tests/test_heartbeat.cpp.
// ============================================================================

#include "rtlslink/heartbeat.hpp"

#include <limits>

#include <nlohmann/json.hpp>

namespace rtlslink {

using nlohmann::json;

// ---------------------------------------------------------------------------
// Field readers. Each one looks at a single key and never throws:
// a missing key or a value of the wrong type yields the fallback / nullopt.
// ---------------------------------------------------------------------------

static std::string str_or(const json& j, const char* key, const char* fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

static std::optional<bool> opt_bool(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

// Unsigned integer that must fit in T; out-of-range counts as absent.
template <typename T>
static std::optional<T> opt_uint(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return std::nullopt;
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        if (v > std::numeric_limits<T>::max()) return std::nullopt;
        return static_cast<T>(v);
    }
    auto v = it->get<int64_t>();
    if (v < 0 || static_cast<uint64_t>(v) > std::numeric_limits<T>::max()) return std::nullopt;
    return static_cast<T>(v);
}

static std::optional<double> opt_number(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

// dyn_anchors: [{"id":0,"x":0.0,"y":0.0,"z":-2.0}, ...]
// Entries missing any field are skipped; a non-array leaves the field absent.
static std::optional<std::vector<DynamicAnchor>> opt_anchors(const json& j) {
    auto it = j.find("dyn_anchors");
    if (it == j.end() || !it->is_array()) return std::nullopt;

    std::vector<DynamicAnchor> out;
    out.reserve(it->size());
    for (const auto& e : *it) {
        if (!e.is_object()) continue;
        auto id = opt_uint<uint16_t>(e, "id");
        auto x  = opt_number(e, "x");
        auto y  = opt_number(e, "y");
        auto z  = opt_number(e, "z");
        if (!id || !x || !y || !z) continue;
        out.push_back(DynamicAnchor{*id, *x, *y, *z});
    }
    return out;
}


Result<Device> parse_heartbeat(const uint8_t* data, std::size_t len, const std::string& source_ip) {
    json j = json::parse(data, data + len, /*cb*/nullptr, /*allow_exceptions*/false);
    if (j.is_discarded())
        return decode_error("heartbeat is not valid JSON", source_ip);
    if (!j.is_object())
        return decode_error("heartbeat is not a JSON object", source_ip);

    Device d;
    d.ip         = source_ip;                      // the socket address wins over anything in the payload
    d.id         = str_or(j, "id", "");
    d.role       = role_from_string(str_or(j, "role", "unknown"));
    d.mac        = str_or(j, "mac", "");
    d.uwb_short  = str_or(j, "uwb_short", "");
    d.mav_sys_id = opt_uint<uint8_t>(j, "mav_sysid").value_or(0);
    d.firmware   = str_or(j, "fw", "");

    d.sending_pos  = opt_bool(j, "sending_pos");
    d.anchors_seen = opt_uint<uint8_t>(j, "anchors_seen");
    d.origin_sent  = opt_bool(j, "origin_sent");
    d.rf_enabled   = opt_bool(j, "rf_enabled");
    d.rf_healthy   = opt_bool(j, "rf_healthy");
    d.avg_rate_chz = opt_uint<uint16_t>(j, "avg_rate_cHz");
    d.min_rate_chz = opt_uint<uint16_t>(j, "min_rate_cHz");
    d.max_rate_chz = opt_uint<uint16_t>(j, "max_rate_cHz");

    d.log_level          = opt_uint<uint8_t>(j, "log_level");
    d.log_udp_port       = opt_uint<uint16_t>(j, "log_udp_port");
    d.log_serial_enabled = opt_bool(j, "log_serial_enabled");
    d.log_udp_enabled    = opt_bool(j, "log_udp_enabled");

    d.dynamic_anchors = opt_anchors(j);
    return d;
}

Result<Device> parse_heartbeat(const std::string& payload, const std::string& source_ip) {
    const auto* p = reinterpret_cast<const uint8_t*>(payload.data());
    return parse_heartbeat(p, payload.size(), source_ip);
}

} // namespace rtlslink
