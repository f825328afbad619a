#pragma once
/**
 * @page rl-config-params RTLS-Link Config Flattening
 * @file config_params.hpp
 * @brief DeviceConfig (as `backup-config` emits it) -> write commands.
 *
 * @details
 * PURPOSE
 * -------
 * Applying a saved configuration to a device means replaying it as a list of
 * `write -group G -name N -data "V"` commands. This header holds the typed
 * config, its JSON reader, and the two flatteners.
 *
 * RULES
 * -----
 * - Parameters come out in a fixed order: wifi, then uwb, then app, each in
 *   declaration order below. Absent optional fields are skipped.
 * - uwb.devShortAddr is never written. It is the device's identity on the
 *   UWB network; copying it from another device would create a duplicate.
 * - Anchors flatten to anchorCount, devId1, x1, y1, z1, devId2, ... (1-based).
 *   With no anchor list, a bare anchorCount is written if present.
 * - Numbers print in their shortest round-trip form: 1.5 -> "1.5", 0.0 -> "0".
 *
 * JSON keys are camelCase (ssidST, devShortAddr, mavlinkTargetSystemId, ...).
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rtlslink/commands.hpp"
#include "rtlslink/error.hpp"

namespace rtlslink {

struct WifiConfig {
    uint8_t                     mode{0};              ///< 0 = AP, 1 = station
    std::optional<std::string>  ssid_ap;
    std::optional<std::string>  pswd_ap;
    std::optional<std::string>  ssid_st;
    std::optional<std::string>  pswd_st;
    std::optional<std::string>  gcs_ip;
    std::optional<uint16_t>     udp_port;
    std::optional<uint8_t>      enable_web_server;
    std::optional<uint8_t>      enable_discovery;
    std::optional<uint16_t>     discovery_port;
    std::optional<uint16_t>     log_udp_port;
    std::optional<uint8_t>      log_serial_enabled;
    std::optional<uint8_t>      log_udp_enabled;
};

struct AnchorConfig {
    std::string id;
    double      x{0.0};
    double      y{0.0};
    double      z{0.0};
};

struct UwbConfig {
    uint8_t                                  mode{0};
    std::string                              dev_short_addr;
    std::optional<uint8_t>                   anchor_count;
    std::optional<std::vector<AnchorConfig>> anchors;
    std::optional<double>                    origin_lat;
    std::optional<double>                    origin_lon;
    std::optional<double>                    origin_alt;
    std::optional<uint8_t>                   mavlink_target_system_id;
    std::optional<double>                    rotation_degrees;
    std::optional<uint8_t>                   z_calc_mode;
    std::optional<uint8_t>                   channel;
    std::optional<uint8_t>                   dw_mode;
    std::optional<uint8_t>                   tx_power_level;
    std::optional<uint8_t>                   smart_power_enable;
};

struct AppConfig {
    std::optional<uint8_t> led2_pin;
    std::optional<uint8_t> led2_state;
};

struct DeviceConfig {
    WifiConfig wifi;
    UwbConfig  uwb;
    AppConfig  app;
};

struct GpsOrigin {
    double lat{0.0};
    double lon{0.0};
    double alt{0.0};
};

/// Location-only preset: origin, rotation, anchors.
struct LocationData {
    GpsOrigin                 origin;
    double                    rotation{0.0};
    std::vector<AnchorConfig> anchors;
};

/**
 * @brief Read a DeviceConfig from JSON.
 *
 * Requires wifi.mode, uwb.mode and uwb.devShortAddr (string or number).
 * Anchor ids may be strings or numbers. Anything else missing stays absent.
 */
Result<DeviceConfig> parse_device_config(const nlohmann::json& j);
Result<DeviceConfig> parse_device_config(const std::string& text);

/// Read a LocationData ({origin:{lat,lon,alt}, rotation, anchors:[...]}).
Result<LocationData> parse_location_data(const nlohmann::json& j);

std::vector<ConfigParam> config_to_params(const DeviceConfig& config);
std::vector<ConfigParam> location_to_params(const LocationData& location);

/// One write_param command per tuple, same order.
std::vector<std::string> params_to_commands(const std::vector<ConfigParam>& params);

} // namespace rtlslink
