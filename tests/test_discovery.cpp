#include <doctest/doctest.h>
#include "rtlslink/discovery.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <thread>

using namespace rtlslink;
using namespace std::chrono_literals;

static void send_heartbeat(uint16_t port, const std::string& payload) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    REQUIRE(fd >= 0);
    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(port);
    to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    auto n = ::sendto(fd, payload.data(), payload.size(), 0,
                      reinterpret_cast<const sockaddr*>(&to), sizeof(to));
    ::close(fd);
    REQUIRE(n == static_cast<ssize_t>(payload.size()));
}

// Broadcast on the loopback net so every socket sharing the port gets a copy
// (unicast to an SO_REUSEPORT group reaches only one member). from_ip picks
// the 127/8 source address the receiver sees.
static void broadcast_heartbeat(uint16_t port, const std::string& payload, const char* from_ip) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    REQUIRE(fd >= 0);
    int one = 1;
    REQUIRE(::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) == 0);

    sockaddr_in from{};
    from.sin_family = AF_INET;
    from.sin_port = 0;
    REQUIRE(::inet_pton(AF_INET, from_ip, &from.sin_addr) == 1);
    REQUIRE(::bind(fd, reinterpret_cast<const sockaddr*>(&from), sizeof(from)) == 0);

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(port);
    REQUIRE(::inet_pton(AF_INET, "127.255.255.255", &to.sin_addr) == 1);
    auto n = ::sendto(fd, payload.data(), payload.size(), 0,
                      reinterpret_cast<const sockaddr*>(&to), sizeof(to));
    ::close(fd);
    REQUIRE(n == static_cast<ssize_t>(payload.size()));
}

static DiscoveryOptions loopback_options(std::chrono::milliseconds ttl = kDeviceTtl) {
    DiscoveryOptions o;
    o.port = 0;                  // ephemeral
    o.reuse_port = false;
    o.recv_timeout = 200ms;
    o.ttl = ttl;
    return o;
}

TEST_CASE("udp listener resolves an ephemeral port and times out quietly") {
    auto l = UdpListener::bind(0, UdpOptions{false});
    REQUIRE(l.ok());
    CHECK(l.value().port() != 0);
    auto r = l.value().receive(50);
    REQUIRE(r.ok());
    CHECK_FALSE(r.value().has_value());
}

TEST_CASE("watch step reports a new device from a heartbeat") {
    DiscoveryService svc(loopback_options());
    REQUIRE(svc.start().ok());
    REQUIRE(svc.port() != 0);

    std::vector<Device> seen;
    int updates = 0;
    auto on_update = [&](const std::vector<Device>& d) { seen = d; ++updates; };

    send_heartbeat(svc.port(), R"({"id":"tag-1","role":"tag_tdoa","fw":"1.0"})");
    CHECK(svc.step(on_update));
    CHECK(updates == 1);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].ip == "127.0.0.1");
    CHECK(seen[0].id == "tag-1");

    // a quiet interval with nothing stale produces no update
    CHECK_FALSE(svc.step(on_update));
    CHECK(updates == 1);
}

TEST_CASE("undecodable heartbeats are dropped but still notify") {
    DiscoveryService svc(loopback_options());
    REQUIRE(svc.start().ok());
    send_heartbeat(svc.port(), "not a heartbeat");
    int updates = 0;
    std::vector<Device> seen{Device{}};
    CHECK(svc.step([&](const std::vector<Device>& d) { ++updates; seen = d; }));
    CHECK(updates == 1);
    CHECK(seen.empty());
    CHECK(svc.devices().empty());
}

TEST_CASE("silent devices expire after the TTL and trigger an update") {
    DiscoveryService svc(loopback_options(50ms));
    REQUIRE(svc.start().ok());

    std::vector<Device> seen;
    auto on_update = [&](const std::vector<Device>& d) { seen = d; };

    send_heartbeat(svc.port(), R"({"id":"a","role":"anchor"})");
    REQUIRE(svc.step(on_update));
    REQUIRE(seen.size() == 1);

    std::this_thread::sleep_for(100ms);
    CHECK(svc.step(on_update));
    CHECK(seen.empty());
    CHECK(svc.devices().empty());
}

TEST_CASE("snapshot discovery returns after its duration") {
    CancelToken cancel;
    const auto t0 = std::chrono::steady_clock::now();
    auto r = discover_once(0, 300ms, cancel, false);
    const auto took = std::chrono::steady_clock::now() - t0;
    REQUIRE(r.ok());
    CHECK(r.value().empty());
    CHECK(took >= 250ms);
    CHECK(took < 2s);
}

TEST_CASE("snapshot discovery stops early when cancelled") {
    CancelToken cancel;
    cancel.cancel();
    auto r = discover_once(0, 10s, cancel, false);
    REQUIRE(r.ok());
    CHECK(r.value().empty());
}

TEST_CASE("two listeners share a port when reuse is on") {
    auto first = UdpListener::bind(0, UdpOptions{true});
    REQUIRE(first.ok());
    const uint16_t port = first.value().port();
    REQUIRE(port != 0);

    auto second = UdpListener::bind(port, UdpOptions{true});
    REQUIRE(second.ok());
    CHECK(second.value().port() == port);
}

TEST_CASE("snapshot discovery runs beside a watch service on the same port") {
    DiscoveryOptions o = loopback_options();
    o.reuse_port = true;
    DiscoveryService svc(o);
    REQUIRE(svc.start().ok());
    const uint16_t port = svc.port();
    REQUIRE(port != 0);

    CancelToken cancel;
    Result<std::vector<Device>> result = std::vector<Device>{};
    std::thread snapshot([&] { result = discover_once(port, 800ms, cancel, true); });

    std::this_thread::sleep_for(150ms);
    broadcast_heartbeat(port, R"({"id":"old","role":"anchor"})", "127.0.0.2");
    broadcast_heartbeat(port, R"({"id":"tag-9","role":"tag_tdoa"})", "127.0.0.1");
    broadcast_heartbeat(port, R"({"id":"new","role":"anchor"})", "127.0.0.2");
    snapshot.join();

    REQUIRE(result.ok());
    const auto& devs = result.value();
    REQUIRE(devs.size() == 2);
    CHECK(devs[0].ip == "127.0.0.1");
    CHECK(devs[0].id == "tag-9");
    CHECK(devs[1].ip == "127.0.0.2");
    CHECK(devs[1].id == "new");
}
