// ============================================================================
// config_params.cpp - implementation for config_params.hpp
// ============================================================================

#include "rtlslink/config_params.hpp"

#include <limits>

#include <spdlog/fmt/fmt.h>

namespace rtlslink {

using nlohmann::json;

// ---------------------------------------------------------------------------
// JSON readers. Optional fields of the wrong type are treated as absent;
// only the few required fields can fail the parse.
// ---------------------------------------------------------------------------

template <typename T>
static std::optional<T> opt_uint(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return std::nullopt;
    auto v = it->get<int64_t>();
    if (v < 0 || static_cast<uint64_t>(v) > std::numeric_limits<T>::max()) return std::nullopt;
    return static_cast<T>(v);
}

static std::optional<double> opt_double(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

static std::optional<std::string> opt_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// Short addresses and anchor ids show up both as "1" and as 1.
static std::optional<std::string> string_or_number(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    return std::nullopt;
}

static Result<std::vector<AnchorConfig>> read_anchors(const json& arr) {
    std::vector<AnchorConfig> out;
    for (const auto& a : arr) {
        if (!a.is_object()) return decode_error("anchor entry is not an object");
        auto id = string_or_number(a, "id");
        auto x  = opt_double(a, "x");
        auto y  = opt_double(a, "y");
        auto z  = opt_double(a, "z");
        if (!id || !x || !y || !z) return decode_error("anchor entry needs id, x, y, z");
        out.push_back(AnchorConfig{*id, *x, *y, *z});
    }
    return out;
}

Result<DeviceConfig> parse_device_config(const json& j) {
    if (!j.is_object()) return decode_error("config is not a JSON object");

    auto wit = j.find("wifi");
    auto uit = j.find("uwb");
    if (wit == j.end() || !wit->is_object()) return decode_error("config has no wifi section");
    if (uit == j.end() || !uit->is_object()) return decode_error("config has no uwb section");
    const json& w = *wit;
    const json& u = *uit;

    DeviceConfig c;

    auto wmode = opt_uint<uint8_t>(w, "mode");
    if (!wmode) return decode_error("wifi.mode missing or not a small integer");
    c.wifi.mode               = *wmode;
    c.wifi.ssid_ap            = opt_string(w, "ssidAP");
    c.wifi.pswd_ap            = opt_string(w, "pswdAP");
    c.wifi.ssid_st            = opt_string(w, "ssidST");
    c.wifi.pswd_st            = opt_string(w, "pswdST");
    c.wifi.gcs_ip             = opt_string(w, "gcsIp");
    c.wifi.udp_port           = opt_uint<uint16_t>(w, "udpPort");
    c.wifi.enable_web_server  = opt_uint<uint8_t>(w, "enableWebServer");
    c.wifi.enable_discovery   = opt_uint<uint8_t>(w, "enableDiscovery");
    c.wifi.discovery_port     = opt_uint<uint16_t>(w, "discoveryPort");
    c.wifi.log_udp_port       = opt_uint<uint16_t>(w, "logUdpPort");
    c.wifi.log_serial_enabled = opt_uint<uint8_t>(w, "logSerialEnabled");
    c.wifi.log_udp_enabled    = opt_uint<uint8_t>(w, "logUdpEnabled");

    auto umode = opt_uint<uint8_t>(u, "mode");
    if (!umode) return decode_error("uwb.mode missing or not a small integer");
    auto addr = string_or_number(u, "devShortAddr");
    if (!addr) return decode_error("uwb.devShortAddr missing");
    c.uwb.mode           = *umode;
    c.uwb.dev_short_addr = *addr;
    c.uwb.anchor_count   = opt_uint<uint8_t>(u, "anchorCount");
    if (auto a = u.find("anchors"); a != u.end() && a->is_array()) {
        auto anchors = read_anchors(*a);
        if (!anchors) return anchors.error();
        c.uwb.anchors = std::move(anchors.value());
    }
    c.uwb.origin_lat               = opt_double(u, "originLat");
    c.uwb.origin_lon               = opt_double(u, "originLon");
    c.uwb.origin_alt               = opt_double(u, "originAlt");
    c.uwb.mavlink_target_system_id = opt_uint<uint8_t>(u, "mavlinkTargetSystemId");
    c.uwb.rotation_degrees         = opt_double(u, "rotationDegrees");
    c.uwb.z_calc_mode              = opt_uint<uint8_t>(u, "zCalcMode");
    c.uwb.channel                  = opt_uint<uint8_t>(u, "channel");
    c.uwb.dw_mode                  = opt_uint<uint8_t>(u, "dwMode");
    c.uwb.tx_power_level           = opt_uint<uint8_t>(u, "txPowerLevel");
    c.uwb.smart_power_enable       = opt_uint<uint8_t>(u, "smartPowerEnable");

    if (auto a = j.find("app"); a != j.end() && a->is_object()) {
        c.app.led2_pin   = opt_uint<uint8_t>(*a, "led2Pin");
        c.app.led2_state = opt_uint<uint8_t>(*a, "led2State");
    }
    return c;
}

Result<DeviceConfig> parse_device_config(const std::string& text) {
    json j = json::parse(text, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) return decode_error("config is not valid JSON");
    return parse_device_config(j);
}

Result<LocationData> parse_location_data(const json& j) {
    if (!j.is_object()) return decode_error("location is not a JSON object");
    auto o = j.find("origin");
    if (o == j.end() || !o->is_object()) return decode_error("location has no origin");

    auto lat = opt_double(*o, "lat");
    auto lon = opt_double(*o, "lon");
    auto alt = opt_double(*o, "alt");
    auto rot = opt_double(j, "rotation");
    if (!lat || !lon || !alt) return decode_error("origin needs lat, lon, alt");
    if (!rot) return decode_error("location has no rotation");

    LocationData loc;
    loc.origin   = GpsOrigin{*lat, *lon, *alt};
    loc.rotation = *rot;
    if (auto a = j.find("anchors"); a != j.end() && a->is_array()) {
        auto anchors = read_anchors(*a);
        if (!anchors) return anchors.error();
        loc.anchors = std::move(anchors.value());
    }
    return loc;
}


// ---------------------------------------------------------------------------
// Flattening
// ---------------------------------------------------------------------------

static std::string num(double v)   { return fmt::format("{}", v); }
static std::string num(unsigned v) { return std::to_string(v); }

namespace {

// Appends (group, name, value) for present fields only.
struct Emitter {
    std::vector<ConfigParam>& out;
    const char*               group;

    void put(const std::string& name, std::string value) {
        out.push_back(ConfigParam{group, name, std::move(value)});
    }
    void opt(const char* name, const std::optional<std::string>& v) {
        if (v) put(name, *v);
    }
    void opt(const char* name, const std::optional<double>& v) {
        if (v) put(name, num(*v));
    }
    template <typename T>
    void opt(const char* name, const std::optional<T>& v) {
        if (v) put(name, num(static_cast<unsigned>(*v)));
    }
};

} // namespace

static void put_anchors(Emitter& e, const std::vector<AnchorConfig>& anchors) {
    e.put("anchorCount", std::to_string(anchors.size()));
    for (std::size_t i = 0; i < anchors.size(); ++i) {
        const std::string idx = std::to_string(i + 1);   // firmware slots are 1-based
        e.put("devId" + idx, anchors[i].id);
        e.put("x" + idx, num(anchors[i].x));
        e.put("y" + idx, num(anchors[i].y));
        e.put("z" + idx, num(anchors[i].z));
    }
}

std::vector<ConfigParam> config_to_params(const DeviceConfig& config) {
    std::vector<ConfigParam> out;

    const WifiConfig& w = config.wifi;
    Emitter wifi{out, "wifi"};
    wifi.put("mode", num(static_cast<unsigned>(w.mode)));
    wifi.opt("ssidAP",           w.ssid_ap);
    wifi.opt("pswdAP",           w.pswd_ap);
    wifi.opt("ssidST",           w.ssid_st);
    wifi.opt("pswdST",           w.pswd_st);
    wifi.opt("gcsIp",            w.gcs_ip);
    wifi.opt("udpPort",          w.udp_port);
    wifi.opt("enableWebServer",  w.enable_web_server);
    wifi.opt("enableDiscovery",  w.enable_discovery);
    wifi.opt("discoveryPort",    w.discovery_port);
    wifi.opt("logUdpPort",       w.log_udp_port);
    wifi.opt("logSerialEnabled", w.log_serial_enabled);
    wifi.opt("logUdpEnabled",    w.log_udp_enabled);

    const UwbConfig& u = config.uwb;
    Emitter uwb{out, "uwb"};
    uwb.put("mode", num(static_cast<unsigned>(u.mode)));
    // devShortAddr stays on the device
    if (u.anchors) {
        if (!u.anchors->empty()) put_anchors(uwb, *u.anchors);
    } else {
        uwb.opt("anchorCount", u.anchor_count);
    }
    uwb.opt("originLat",             u.origin_lat);
    uwb.opt("originLon",             u.origin_lon);
    uwb.opt("originAlt",             u.origin_alt);
    uwb.opt("mavlinkTargetSystemId", u.mavlink_target_system_id);
    uwb.opt("rotationDegrees",       u.rotation_degrees);
    uwb.opt("zCalcMode",             u.z_calc_mode);
    uwb.opt("channel",               u.channel);
    uwb.opt("dwMode",                u.dw_mode);
    uwb.opt("txPowerLevel",          u.tx_power_level);
    uwb.opt("smartPowerEnable",      u.smart_power_enable);

    Emitter app{out, "app"};
    app.opt("led2Pin",   config.app.led2_pin);
    app.opt("led2State", config.app.led2_state);

    return out;
}

std::vector<ConfigParam> location_to_params(const LocationData& location) {
    std::vector<ConfigParam> out;
    Emitter uwb{out, "uwb"};
    uwb.put("originLat",       num(location.origin.lat));
    uwb.put("originLon",       num(location.origin.lon));
    uwb.put("originAlt",       num(location.origin.alt));
    uwb.put("rotationDegrees", num(location.rotation));
    if (!location.anchors.empty()) put_anchors(uwb, location.anchors);
    return out;
}

std::vector<std::string> params_to_commands(const std::vector<ConfigParam>& params) {
    std::vector<std::string> out;
    out.reserve(params.size());
    for (const auto& p : params)
        out.push_back(commands::write_param(p.group, p.name, p.value));
    return out;
}

} // namespace rtlslink
