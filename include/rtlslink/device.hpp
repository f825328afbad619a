#pragma once
/**
 * @page rl-device RTLS-Link Device Record
 * @file device.hpp
 * @brief Identity and telemetry snapshot for one RTLS-Link device on the LAN.
 *
 * @details
 * A Device is what one heartbeat says about one endpoint. The IP address is
 * the key everywhere (registry, batch results, CLI targets). Everything else
 * is whatever the firmware chose to send in its last heartbeat.
 *
 * OPTIONAL TELEMETRY
 * ------------------
 * Telemetry fields are std::optional on purpose: older firmware does not send
 * them, and "not reported" must never look like "reported false". A tag with
 * sending_pos == std::nullopt is "unknown", not "not sending".
 *
 * REPLACE, DON'T MERGE
 * --------------------
 * A new heartbeat from the same IP replaces the whole record. A field missing
 * from the new heartbeat goes back to absent. See device_registry.hpp.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace rtlslink {

enum class DeviceRole {
    Anchor,       ///< TWR anchor (uwb mode 0)
    Tag,          ///< TWR tag (uwb mode 1)
    AnchorTdoa,   ///< TDoA anchor (uwb mode 3)
    TagTdoa,      ///< TDoA tag (uwb mode 4)
    Calibration,  ///< calibration mode (uwb mode 2)
    Unknown
};

/** @brief Heartbeat role string -> enum. Unrecognized strings give Unknown. */
DeviceRole role_from_string(const std::string& s);

/** @brief Enum -> heartbeat spelling ("anchor_tdoa", ...). */
const char* role_to_string(DeviceRole role);

bool is_anchor_role(DeviceRole role);
bool is_tag_role(DeviceRole role);

/// Anchor position a TDoA tag is currently using (from `dyn_anchors`).
struct DynamicAnchor {
    uint16_t id{0};
    double   x{0.0};
    double   y{0.0};
    double   z{0.0};
};

struct Device {
    std::string ip;          ///< registry key; may carry ":port" in test setups
    std::string id;
    DeviceRole  role{DeviceRole::Unknown};
    std::string mac;
    std::string uwb_short;   ///< 1-2 digit UWB short address
    uint8_t     mav_sys_id{0};
    std::string firmware;

    // Telemetry (absent = not reported)
    std::optional<bool>     sending_pos;
    std::optional<uint8_t>  anchors_seen;
    std::optional<bool>     origin_sent;
    std::optional<bool>     rf_enabled;
    std::optional<bool>     rf_healthy;
    std::optional<uint16_t> avg_rate_chz;   ///< centi-Hz: 1000 == 10.0 Hz
    std::optional<uint16_t> min_rate_chz;
    std::optional<uint16_t> max_rate_chz;

    // Logging configuration as reported by the device
    std::optional<uint8_t>  log_level;
    std::optional<uint16_t> log_udp_port;
    std::optional<bool>     log_serial_enabled;
    std::optional<bool>     log_udp_enabled;

    std::optional<std::vector<DynamicAnchor>> dynamic_anchors;
};

/**
 * @brief Serialize for `--json` output. Absent telemetry keys are omitted.
 *
 * Keys follow the camelCase names the desktop frontend consumes
 * (ip, id, role, mac, uwbShort, mavSysId, firmware, sendingPos, ...).
 */
void to_json(nlohmann::json& j, const Device& d);

} // namespace rtlslink
