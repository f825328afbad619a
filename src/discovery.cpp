// ============================================================================
// discovery.cpp - implementation for discovery.hpp
// ============================================================================

#include "rtlslink/discovery.hpp"
#include "rtlslink/heartbeat.hpp"

#include <algorithm>
#include <map>

#include <spdlog/spdlog.h>

namespace rtlslink {

// Snapshot mode receive timeout. Short so the duration and cancel are honored.
static constexpr int kSnapshotRecvMs = 500;

Result<std::vector<Device>> discover_once(uint16_t port,
                                          std::chrono::milliseconds duration,
                                          const CancelToken& cancel,
                                          bool reuse_port) {
    auto bound = UdpListener::bind(port, UdpOptions{reuse_port});
    if (!bound) return bound.error();
    UdpListener& sock = bound.value();

    spdlog::info("discovery: listening on udp/{} for {} ms", sock.port(), duration.count());

    std::map<std::string, Device> found;          // keyed and ordered by ip
    const auto deadline = Clock::now() + duration;

    while (!cancel.cancelled()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) break;
        int wait_ms = static_cast<int>(std::min<long long>(left.count(), kSnapshotRecvMs));

        auto r = sock.receive(wait_ms);
        if (!r) {
            spdlog::warn("discovery: receive failed: {}", r.error().message);
            continue;
        }
        if (!r.value()) continue;                 // timeout slice

        const Datagram& d = *r.value();
        auto dev = parse_heartbeat(d.data.data(), d.data.size(), d.from_ip);
        if (!dev) {
            spdlog::debug("discovery: dropped packet from {}: {}", d.from_ip, dev.error().message);
            continue;
        }
        found[d.from_ip] = std::move(dev.value());
    }

    std::vector<Device> out;
    out.reserve(found.size());
    for (auto& kv : found) out.push_back(std::move(kv.second));
    return out;
}


// ---------------------------------------------------------------------------
// DiscoveryService
// ---------------------------------------------------------------------------

DiscoveryService::DiscoveryService(DiscoveryOptions opts)
    : opts_(opts), registry_(opts.ttl) {}

Status DiscoveryService::start() {
    if (listener_) return {};
    auto bound = UdpListener::bind(opts_.port, UdpOptions{opts_.reuse_port});
    if (!bound) {
        spdlog::error("discovery: cannot bind udp/{}: {}", opts_.port, bound.error().message);
        return bound.error();
    }
    listener_.emplace(std::move(bound.value()));
    spdlog::info("discovery: watching udp/{}", listener_->port());
    return {};
}

uint16_t DiscoveryService::port() const {
    return listener_ ? listener_->port() : 0;
}

bool DiscoveryService::step(const UpdateFn& on_update) {
    if (!listener_) return false;

    const std::size_t before = registry_.size();
    bool received = false;

    auto r = listener_->receive(static_cast<int>(opts_.recv_timeout.count()));
    if (!r) {
        spdlog::warn("discovery: receive failed: {}", r.error().message);
    } else if (r.value()) {
        const Datagram& d = *r.value();
        received = true;
        auto dev = parse_heartbeat(d.data.data(), d.data.size(), d.from_ip);
        if (dev) {
            registry_.upsert(std::move(dev.value()), Clock::now());
        } else {
            spdlog::debug("discovery: dropped packet from {}: {}", d.from_ip, dev.error().message);
        }
    }

    std::size_t pruned = registry_.prune(Clock::now());
    if (pruned > 0) spdlog::debug("discovery: pruned {} stale device(s)", pruned);

    if (!received && registry_.size() == before) return false;
    if (on_update) on_update(registry_.snapshot());
    return true;
}

Status DiscoveryService::run(const UpdateFn& on_update, const CancelToken& cancel) {
    if (auto st = start(); !st) return st;
    while (!cancel.cancelled())
        step(on_update);
    return {};
}

} // namespace rtlslink
