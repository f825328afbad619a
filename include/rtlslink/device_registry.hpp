#pragma once
/**
 * @page rl-registry RTLS-Link Device Registry
 * @file device_registry.hpp
 * @brief IP-keyed table of live devices with TTL pruning.
 *
 * @details
 * PURPOSE
 * -------
 * The registry is the roster the watch loop keeps current: one entry per
 * device IP, each stamped with the time its last heartbeat arrived. Devices
 * that stay silent longer than the TTL are dropped by prune().
 *
 * RULES
 * -----
 * - At most one entry per IP. upsert() replaces the whole record.
 * - An entry is stale when (now - last_seen) is strictly greater than the TTL.
 * - snapshot() is always sorted by IP string, so callers can diff it cheaply.
 *
 * Time is passed in rather than read from a clock, so tests can age entries
 * without sleeping.
 *
 * OWNERSHIP
 * ---------
 * Not thread-safe. The discovery loop owns its registry; readers get copies
 * through snapshot().
 */

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "rtlslink/device.hpp"

namespace rtlslink {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Default heartbeat time-to-live.
constexpr std::chrono::milliseconds kDeviceTtl{5000};

class DeviceRegistry {
public:
    explicit DeviceRegistry(std::chrono::milliseconds ttl = kDeviceTtl) : ttl_(ttl) {}

    /// Insert or replace the entry for device.ip and stamp it with now.
    void upsert(Device device, TimePoint now);

    /// Remove entries older than the TTL. Returns how many were removed.
    std::size_t prune(TimePoint now);

    /// Copy of all entries, sorted by IP.
    std::vector<Device> snapshot() const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        Device    device;
        TimePoint last_seen;
    };

    std::chrono::milliseconds     ttl_;
    std::map<std::string, Entry>  entries_;   // ordered by ip
};

} // namespace rtlslink
