// ============================================================================
// device.cpp - implementation for device.hpp
// ============================================================================

#include "rtlslink/device.hpp"

#include <nlohmann/json.hpp>

namespace rtlslink {

DeviceRole role_from_string(const std::string& s) {
    if (s == "anchor")      return DeviceRole::Anchor;
    if (s == "tag")         return DeviceRole::Tag;
    if (s == "anchor_tdoa") return DeviceRole::AnchorTdoa;
    if (s == "tag_tdoa")    return DeviceRole::TagTdoa;
    if (s == "calibration") return DeviceRole::Calibration;
    return DeviceRole::Unknown;
}

const char* role_to_string(DeviceRole role) {
    switch (role) {
        case DeviceRole::Anchor:      return "anchor";
        case DeviceRole::Tag:         return "tag";
        case DeviceRole::AnchorTdoa:  return "anchor_tdoa";
        case DeviceRole::TagTdoa:     return "tag_tdoa";
        case DeviceRole::Calibration: return "calibration";
        case DeviceRole::Unknown:     break;
    }
    return "unknown";
}

bool is_anchor_role(DeviceRole role) {
    return role == DeviceRole::Anchor || role == DeviceRole::AnchorTdoa;
}

bool is_tag_role(DeviceRole role) {
    return role == DeviceRole::Tag || role == DeviceRole::TagTdoa;
}

// Only emit keys the device actually reported.
template <typename T>
static void put_opt(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

void to_json(nlohmann::json& j, const Device& d) {
    j = nlohmann::json{
        {"ip",       d.ip},
        {"id",       d.id},
        {"role",     role_to_string(d.role)},
        {"mac",      d.mac},
        {"uwbShort", d.uwb_short},
        {"mavSysId", d.mav_sys_id},
        {"firmware", d.firmware},
    };

    put_opt(j, "sendingPos",       d.sending_pos);
    put_opt(j, "anchorsSeen",      d.anchors_seen);
    put_opt(j, "originSent",       d.origin_sent);
    put_opt(j, "rfEnabled",        d.rf_enabled);
    put_opt(j, "rfHealthy",        d.rf_healthy);
    put_opt(j, "avgRateCHz",       d.avg_rate_chz);
    put_opt(j, "minRateCHz",       d.min_rate_chz);
    put_opt(j, "maxRateCHz",       d.max_rate_chz);
    put_opt(j, "logLevel",         d.log_level);
    put_opt(j, "logUdpPort",       d.log_udp_port);
    put_opt(j, "logSerialEnabled", d.log_serial_enabled);
    put_opt(j, "logUdpEnabled",    d.log_udp_enabled);

    if (d.dynamic_anchors) {
        auto arr = nlohmann::json::array();
        for (const auto& a : *d.dynamic_anchors)
            arr.push_back({{"id", a.id}, {"x", a.x}, {"y", a.y}, {"z", a.z}});
        j["dynamicAnchors"] = std::move(arr);
    }
}

} // namespace rtlslink
