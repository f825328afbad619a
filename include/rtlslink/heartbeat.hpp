#pragma once
/**
 * @file heartbeat.hpp
 * @brief Heartbeat datagram -> Device. Pure function, no I/O.
 *
 * @details
 * Devices broadcast a small JSON object on the discovery port every second or
 * so. Firmware versions differ in what they include, so decoding is
 * permissive:
 *   - Only text that is not JSON (or JSON that is not an object) fails.
 *   - Required strings default to "" and required numbers to 0.
 *   - Optional telemetry that is absent, null, or the wrong type stays absent.
 *   - Unknown role strings become DeviceRole::Unknown.
 *
 * Wire keys: id, role, mac, uwb_short, mav_sysid, fw, sending_pos,
 * anchors_seen, origin_sent, rf_enabled, rf_healthy, avg_rate_cHz,
 * min_rate_cHz, max_rate_cHz, log_level, log_udp_port, log_serial_enabled,
 * log_udp_enabled, dyn_anchors.
 *
 * @code
 *   auto r = rtlslink::parse_heartbeat(buf, len, "192.168.1.40");
 *   if (r) registry.upsert(std::move(r.value()), now);
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "rtlslink/device.hpp"
#include "rtlslink/error.hpp"

namespace rtlslink {

Result<Device> parse_heartbeat(const uint8_t* data, std::size_t len, const std::string& source_ip);

Result<Device> parse_heartbeat(const std::string& payload, const std::string& source_ip);

} // namespace rtlslink
