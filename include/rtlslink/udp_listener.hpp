#pragma once
/**
 * @page rl-udp RTLS-Link UDP Listener
 * @file udp_listener.hpp
 * @brief Bound IPv4 UDP socket with poll()-based timed receive.
 *
 * @details
 * PURPOSE
 * -------
 * Both passive channels (heartbeats on 3333, log records on 3334) are plain
 * broadcast UDP. UdpListener owns one POSIX socket for either of them.
 *
 * SOCKET SETUP
 * ------------
 * - AF_INET / SOCK_DGRAM, bound to 0.0.0.0:port (port 0 = ephemeral).
 * - SO_REUSEADDR always. SO_REUSEPORT when UdpOptions::reuse_port is set, so a
 *   GUI and a CLI can listen on the same port. On a platform without
 *   SO_REUSEPORT the option is ignored and a second bind fails with a
 *   Transport error.
 * - SO_BROADCAST so broadcast datagrams are accepted.
 * - O_NONBLOCK; receive() waits with poll(2) and a millisecond timeout.
 *
 * @code
 *   auto l = rtlslink::UdpListener::bind(3333, {});
 *   if (!l) return l.error();
 *   auto d = l.value().receive(500);
 *   if (d && d.value()) handle(*d.value());
 * @endcode
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rtlslink/error.hpp"

namespace rtlslink {

struct UdpOptions {
    bool reuse_port{true};
};

/// One received datagram and the IPv4 address it came from.
struct Datagram {
    std::string          from_ip;
    std::vector<uint8_t> data;
};

class UdpListener {
public:
    static Result<UdpListener> bind(uint16_t port, const UdpOptions& opts);

    UdpListener(UdpListener&& other) noexcept;
    UdpListener& operator=(UdpListener&& other) noexcept;
    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;
    ~UdpListener();

    /// Port actually bound (resolves port 0).
    uint16_t port() const { return port_; }

    /**
     * @brief Wait up to timeout_ms for one datagram.
     * @return a Datagram, an empty optional on timeout, or a Transport error.
     */
    Result<std::optional<Datagram>> receive(int timeout_ms);

    void close();

private:
    UdpListener(int fd, uint16_t port) : fd_(fd), port_(port) {}

    int      fd_{-1};
    uint16_t port_{0};
};

} // namespace rtlslink
