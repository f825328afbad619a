// ============================================================================
// udp_listener.cpp - implementation for udp_listener.hpp
// ============================================================================

#include "rtlslink/udp_listener.hpp"

#include <arpa/inet.h>     // inet_ntop, htons
#include <fcntl.h>         // fcntl O_NONBLOCK
#include <netinet/in.h>    // sockaddr_in
#include <poll.h>          // poll(2) for timed receive
#include <sys/socket.h>    // socket, bind, recvfrom, setsockopt
#include <unistd.h>        // close

#include <cerrno>
#include <cstring>         // strerror

namespace rtlslink {

// Largest heartbeat/log datagram we expect; UDP payload limit is the hard cap.
static constexpr std::size_t kMaxDatagram = 65507;

static std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

// ---------------------------------------------------------------------------
// bind()
// ------
// socket -> options -> non-blocking -> bind -> getsockname (for port 0).
// Any failure closes the fd and reports a Transport error.
// ---------------------------------------------------------------------------
Result<UdpListener> UdpListener::bind(uint16_t port, const UdpOptions& opts) {
    const std::string where = "0.0.0.0:" + std::to_string(port);

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return transport_error(where, errno_text("socket"));

    auto fail = [&](const char* what) -> Error {
        Error e = transport_error(where, errno_text(what));
        ::close(fd);
        return e;
    };

    int one = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0)
        return fail("setsockopt(SO_REUSEADDR)");
#ifdef SO_REUSEPORT
    if (opts.reuse_port &&
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one)) != 0)
        return fail("setsockopt(SO_REUSEPORT)");
#else
    (void)opts;                                   // second bind will fail instead
#endif
    if (::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) != 0)
        return fail("setsockopt(SO_BROADCAST)");

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0)
        return fail("fcntl(O_NONBLOCK)");

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port        = htons(port);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        return fail("bind");

    sockaddr_in bound{};
    socklen_t   blen = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &blen) != 0)
        return fail("getsockname");

    return UdpListener(fd, ntohs(bound.sin_port));
}

UdpListener::UdpListener(UdpListener&& other) noexcept
    : fd_(other.fd_), port_(other.port_) {
    other.fd_ = -1;
}

UdpListener& UdpListener::operator=(UdpListener&& other) noexcept {
    if (this != &other) {
        close();
        fd_   = other.fd_;
        port_ = other.port_;
        other.fd_ = -1;
    }
    return *this;
}

UdpListener::~UdpListener() { close(); }

void UdpListener::close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

// ---------------------------------------------------------------------------
// receive()
// ---------
// poll() bounds the wait; EINTR counts as a timeout so signal handlers can
// trip a CancelToken and the caller's loop notices on the next iteration.
// ---------------------------------------------------------------------------
Result<std::optional<Datagram>> UdpListener::receive(int timeout_ms) {
    if (fd_ < 0) return transport_error("", "listener is closed");

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return std::optional<Datagram>{};
    if (pr < 0) {
        if (errno == EINTR) return std::optional<Datagram>{};
        return transport_error("", errno_text("poll"));
    }

    Datagram d;
    d.data.resize(kMaxDatagram);
    sockaddr_in from{};
    socklen_t   flen = sizeof(from);
    ssize_t n = ::recvfrom(fd_, d.data.data(), d.data.size(), 0,
                           reinterpret_cast<sockaddr*>(&from), &flen);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return std::optional<Datagram>{};
        return transport_error("", errno_text("recvfrom"));
    }
    d.data.resize(static_cast<std::size_t>(n));

    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &from.sin_addr, buf, sizeof(buf));
    d.from_ip = buf;
    return std::optional<Datagram>{std::move(d)};
}

} // namespace rtlslink
