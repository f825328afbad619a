#pragma once
/**
 * @page rl-discovery RTLS-Link Discovery
 * @file discovery.hpp
 * @brief Find devices on the LAN by listening for their UDP heartbeats.
 *
 * @details
 * PURPOSE
 * -------
 * Every device broadcasts a JSON heartbeat to the discovery port (default
 * 3333). The host never sends anything; it only listens. Two ways to listen:
 *
 * - Snapshot: discover_once() listens for a fixed duration and returns every
 *   device heard, sorted by IP. No pruning. This is what `rtlslink discover`
 *   and the device-targeting helpers use.
 * - Watch: DiscoveryService keeps a DeviceRegistry current. Each step() waits
 *   up to the receive timeout (2 s) for one packet, upserts it, prunes
 *   anything silent for longer than the TTL (5 s), and calls on_update with
 *   the sorted list when any packet arrived (even one that failed to decode)
 *   or the set size changed.
 *
 * FAILURES
 * --------
 * - Bind failure: returned to the caller. Nothing else is fatal.
 * - Receive error: logged (warn) and the loop continues.
 * - Undecodable packet: dropped (debug log).
 *
 * EXAMPLE
 * -------
 * @code
 *   rtlslink::CancelToken stop;
 *   rtlslink::DiscoveryService svc({});
 *   auto st = svc.run([](const std::vector<rtlslink::Device>& devs) {
 *       std::cout << devs.size() << " device(s)\n";
 *   }, stop);
 * @endcode
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "rtlslink/cancel.hpp"
#include "rtlslink/device.hpp"
#include "rtlslink/device_registry.hpp"
#include "rtlslink/error.hpp"
#include "rtlslink/udp_listener.hpp"

namespace rtlslink {

constexpr uint16_t kDefaultDiscoveryPort = 3333;

struct DiscoveryOptions {
    uint16_t                  port{kDefaultDiscoveryPort};
    bool                      reuse_port{true};
    std::chrono::milliseconds recv_timeout{2000};   ///< per step() wait
    std::chrono::milliseconds ttl{kDeviceTtl};
};

/**
 * @brief Listen for `duration` and return every device heard, sorted by IP.
 *
 * Receives with a 500 ms per-receive timeout so cancellation is noticed
 * promptly. A later heartbeat from the same IP overwrites the earlier one.
 */
Result<std::vector<Device>> discover_once(uint16_t port,
                                          std::chrono::milliseconds duration,
                                          const CancelToken& cancel,
                                          bool reuse_port = true);

class DiscoveryService {
public:
    using UpdateFn = std::function<void(const std::vector<Device>&)>;

    explicit DiscoveryService(DiscoveryOptions opts);

    /// Bind the listener. Called by run() if not done already.
    Status start();

    /// Bound port, once started (resolves port 0).
    uint16_t port() const;

    /**
     * @brief One iteration: wait, decode, upsert, prune, maybe notify.
     * @return true if on_update was called.
     */
    bool step(const UpdateFn& on_update);

    /// Loop step() until cancel trips. Fails only if the bind fails.
    Status run(const UpdateFn& on_update, const CancelToken& cancel);

    std::vector<Device> devices() const { return registry_.snapshot(); }

private:
    DiscoveryOptions           opts_;
    DeviceRegistry             registry_;
    std::optional<UdpListener> listener_;
};

} // namespace rtlslink
