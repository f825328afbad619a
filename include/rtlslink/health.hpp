#pragma once
/**
 * @file health.hpp
 * @brief Heartbeat telemetry -> health level and a list of human-readable issues.
 *
 * Anchors are always Healthy: they have nothing to report. Tags are judged on
 * position output, anchors in view, origin delivery and rangefinder state.
 * Any other role is Unknown.
 */

#include <string>
#include <vector>

#include "rtlslink/device.hpp"

namespace rtlslink {

enum class HealthLevel { Healthy, Warning, Degraded, Unknown };

const char* to_string(HealthLevel level);

struct DeviceHealth {
    HealthLevel              level{HealthLevel::Unknown};
    std::vector<std::string> issues;
};

/// Fewer anchors than this and a tag cannot produce a position fix.
constexpr unsigned kMinAnchorsForFix = 3;

DeviceHealth calculate_device_health(const Device& device);

} // namespace rtlslink
