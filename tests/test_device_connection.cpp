#include <doctest/doctest.h>
#include "rtlslink/device_connection.hpp"

#include <atomic>
#include <functional>
#include <thread>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>

using namespace rtlslink;
using namespace std::chrono_literals;

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp           = boost::asio::ip::tcp;
using ServerWs      = websocket::stream<tcp::socket>;

// ---------------------------------------------------------------------------
// Blocking WebSocket peer on 127.0.0.1:<ephemeral>, serving a fixed number of
// connections on its own thread. The handler sees the raw socket and the
// connection index; helpers below do the upgrade.
// ---------------------------------------------------------------------------
class FakeDevice {
public:
    using Handler = std::function<void(tcp::socket, int)>;

    FakeDevice(Handler handler, int connections = 1)
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        thread_ = std::thread([this, handler, connections] {
            for (int i = 0; i < connections; ++i) {
                tcp::socket s(io_);
                boost::system::error_code ec;
                acceptor_.accept(s, ec);
                if (ec) return;
                handler(std::move(s), i);
            }
        });
    }
    ~FakeDevice() { thread_.join(); }

    std::string address() const {
        return "127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
    }

private:
    boost::asio::io_context io_;
    tcp::acceptor           acceptor_;
    std::thread             thread_;
};

static std::string read_text(ServerWs& ws) {
    beast::flat_buffer buf;
    boost::system::error_code ec;
    ws.read(buf, ec);
    if (ec) return {};
    return beast::buffers_to_string(buf.data());
}

static void write_text(ServerWs& ws, const std::string& s) {
    boost::system::error_code ec;
    ws.text(true);
    ws.write(boost::asio::buffer(s), ec);
}

// Read until the client goes away (answers its close frame).
static void drain(ServerWs& ws) {
    beast::flat_buffer buf;
    boost::system::error_code ec;
    while (!ec) {
        ws.read(buf, ec);
        buf.consume(buf.size());
    }
}

// Upgrade, then answer each incoming command with reply_for(command).
static FakeDevice::Handler replying(std::function<std::string(const std::string&)> reply_for) {
    return [reply_for](tcp::socket s, int) {
        ServerWs ws(std::move(s));
        boost::system::error_code ec;
        ws.accept(ec);
        if (ec) return;
        for (;;) {
            std::string cmd = read_text(ws);
            if (cmd.empty()) return;
            write_text(ws, reply_for(cmd));
        }
    };
}

TEST_CASE("host and port split") {
    CHECK(split_host_port("192.168.1.10").host == "192.168.1.10");
    CHECK(split_host_port("192.168.1.10").port == "80");
    CHECK(split_host_port("127.0.0.1:8081").port == "8081");
}

TEST_CASE("one-shot command returns the reply text") {
    std::string received;
    FakeDevice dev(replying([&](const std::string& c) { received = c; return std::string("OK"); }));
    auto r = run_blocking([&](AsyncContext& ctx) { return send_command(ctx, dev.address(), "version", 2000ms); });
    REQUIRE(r.ok());
    CHECK(r.value() == "OK");
    CHECK(received == "version");
}

TEST_CASE("device error reply becomes a protocol error") {
    FakeDevice dev(replying([](const std::string&) { return std::string("Error: invalid group"); }));
    auto r = run_blocking([&](AsyncContext& ctx) {
        return send_command(ctx, dev.address(), "read -group nope -name x", 2000ms);
    });
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind == ErrorKind::Protocol);
    CHECK(r.error().message == "invalid group");
    CHECK(r.error().ip == dev.address());
}

TEST_CASE("binary frames before the reply are skipped") {
    FakeDevice dev([](tcp::socket s, int) {
        ServerWs ws(std::move(s));
        boost::system::error_code ec;
        ws.accept(ec);
        if (ec) return;
        read_text(ws);
        ws.binary(true);
        const char junk[] = {1, 2, 3};
        ws.write(boost::asio::buffer(junk, sizeof(junk)), ec);
        write_text(ws, "OK - 1.4.2");
        drain(ws);
    });
    auto r = run_blocking([&](AsyncContext& ctx) { return send_command(ctx, dev.address(), "version", 2000ms); });
    REQUIRE(r.ok());
    CHECK(r.value() == "OK - 1.4.2");
}

TEST_CASE("close before reply is an invalid response") {
    FakeDevice dev([](tcp::socket s, int) {
        ServerWs ws(std::move(s));
        boost::system::error_code ec;
        ws.accept(ec);
        if (ec) return;
        read_text(ws);
        ws.close(websocket::close_code::normal, ec);
    });
    auto r = run_blocking([&](AsyncContext& ctx) { return send_command(ctx, dev.address(), "reboot", 2000ms); });
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind == ErrorKind::InvalidResponse);
    CHECK(r.error().message == "No response received for command 'reboot'");
}

TEST_CASE("silent device times out") {
    FakeDevice dev([](tcp::socket s, int) {
        ServerWs ws(std::move(s));
        boost::system::error_code ec;
        ws.accept(ec);
        if (ec) return;
        read_text(ws);
        drain(ws);                                 // returns once the client drops the socket
    });
    auto r = run_blocking([&](AsyncContext& ctx) { return send_command(ctx, dev.address(), "version", 200ms); });
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind == ErrorKind::Timeout);
}

TEST_CASE("refused connection is a transport error") {
    std::string addr;
    {
        boost::asio::io_context io;
        tcp::acceptor a(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        addr = "127.0.0.1:" + std::to_string(a.local_endpoint().port());
    }
    auto r = run_blocking([&](AsyncContext& ctx) { return send_command(ctx, addr, "version", 500ms); });
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind == ErrorKind::Transport);
}

TEST_CASE("batch on one session stops at the first failure") {
    std::atomic<int> seen{0};
    FakeDevice dev(replying([&](const std::string& c) {
        ++seen;
        if (c.find("bad") != std::string::npos) return std::string("Failed to write parameter");
        return std::string("OK");
    }));
    auto r = run_blocking([&](AsyncContext& ctx) {
        return send_commands(ctx, dev.address(),
                             {"write -group wifi -name mode -data \"1\"",
                              "write -group bad -name x -data \"1\"",
                              "write -group wifi -name ssidST -data \"never\""},
                             2000ms);
    });
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().kind == ErrorKind::Protocol);
    CHECK(seen == 2);
}

TEST_CASE("JSON-class command is parsed on a persistent session") {
    FakeDevice dev(replying([](const std::string&) {
        return std::string("OK\n{\"configs\":[\"a\",\"b\"]}");
    }));
    auto r = run_blocking([&](AsyncContext& ctx) -> Result<CommandResponse> {
        auto conn = DeviceConnection::connect(ctx, dev.address(), 2000ms);
        if (!conn) return conn.error();
        auto resp = conn.value()->send(ctx, "list-configs");
        auto st = conn.value()->close(ctx);
        CHECK(st.ok());
        CHECK_FALSE(conn.value()->is_open());
        return resp;
    });
    REQUIRE(r.ok());
    REQUIRE(r.value().json.has_value());
    CHECK((*r.value().json)["configs"][1] == "b");
}

TEST_CASE("sessions come only from connect") {
    static_assert(!std::is_constructible<DeviceConnection, boost::asio::io_context&, std::string,
                                         std::chrono::milliseconds>::value,
                  "a session must be opened through connect()");

    FakeDevice dev(replying([](const std::string&) { return std::string("OK"); }));
    auto r = run_blocking([&](AsyncContext& ctx) -> Result<std::string> {
        auto conn = DeviceConnection::connect(ctx, dev.address(), 2000ms);
        if (!conn) return conn.error();
        CHECK(conn.value()->is_open());
        CHECK(conn.value()->ip() == dev.address());
        auto reply = conn.value()->send_raw(ctx, "version");
        CHECK(conn.value()->close(ctx).ok());
        return reply;
    });
    REQUIRE(r.ok());
    CHECK(r.value() == "OK");
}

TEST_CASE("retry recovers after a dropped connection") {
    FakeDevice dev([](tcp::socket s, int index) {
        if (index == 0) return;                    // drop before the upgrade
        ServerWs ws(std::move(s));
        boost::system::error_code ec;
        ws.accept(ec);
        if (ec) return;
        read_text(ws);
        write_text(ws, "OK");
        drain(ws);
    }, 2);
    auto r = run_blocking([&](AsyncContext& ctx) {
        return send_command_with_retry(ctx, dev.address(), "start", 2000ms, 2);
    });
    REQUIRE(r.ok());
    CHECK(r.value() == "OK");
}
