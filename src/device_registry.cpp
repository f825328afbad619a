// ============================================================================
// device_registry.cpp - implementation for device_registry.hpp
// ============================================================================

#include "rtlslink/device_registry.hpp"

namespace rtlslink {

void DeviceRegistry::upsert(Device device, TimePoint now) {
    std::string key = device.ip;
    entries_[key] = Entry{std::move(device), now};
}

std::size_t DeviceRegistry::prune(TimePoint now) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.last_seen > ttl_) {     // strictly older than TTL
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::vector<Device> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_)
        out.push_back(kv.second.device);            // std::map keeps ip order
    return out;
}

} // namespace rtlslink
