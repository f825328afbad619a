// ============================================================================
// health.cpp - implementation for health.hpp
// ============================================================================

#include "rtlslink/health.hpp"

namespace rtlslink {

const char* to_string(HealthLevel level) {
    switch (level) {
        case HealthLevel::Healthy:  return "healthy";
        case HealthLevel::Warning:  return "warning";
        case HealthLevel::Degraded: return "degraded";
        case HealthLevel::Unknown:  break;
    }
    return "unknown";
}

static DeviceHealth tag_health(const Device& d) {
    const bool has_telemetry = d.sending_pos || d.anchors_seen || d.origin_sent || d.rf_enabled;
    if (!has_telemetry)
        return DeviceHealth{HealthLevel::Unknown, {"No telemetry data"}};

    const bool not_sending = d.sending_pos && !*d.sending_pos;
    const bool few_anchors = d.anchors_seen && *d.anchors_seen < kMinAnchorsForFix;

    DeviceHealth h;
    if (not_sending)
        h.issues.push_back("Not sending positions");
    if (few_anchors) {
        unsigned n = *d.anchors_seen;
        h.issues.push_back("Only seeing " + std::to_string(n) + (n == 1 ? " anchor" : " anchors"));
    }
    if (d.origin_sent && !*d.origin_sent)
        h.issues.push_back("Origin not sent to autopilot");
    if (d.rf_enabled && *d.rf_enabled && d.rf_healthy && !*d.rf_healthy)
        h.issues.push_back("Rangefinder unhealthy");

    if (h.issues.empty())            h.level = HealthLevel::Healthy;
    else if (not_sending || few_anchors) h.level = HealthLevel::Degraded;
    else                             h.level = HealthLevel::Warning;
    return h;
}

DeviceHealth calculate_device_health(const Device& device) {
    if (is_anchor_role(device.role)) return DeviceHealth{HealthLevel::Healthy, {}};
    if (is_tag_role(device.role))    return tag_health(device);
    return DeviceHealth{HealthLevel::Unknown, {}};
}

} // namespace rtlslink
