// ============================================================================
// device_connection.cpp - implementation for device_connection.hpp
// ============================================================================

#include "rtlslink/device_connection.hpp"

#include <cstdlib>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/error.hpp>

#include <spdlog/spdlog.h>

namespace rtlslink {

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp           = net::ip::tcp;

HostPort split_host_port(const std::string& ip, const char* default_port) {
    auto colon = ip.rfind(':');
    if (colon == std::string::npos) return HostPort{ip, default_port};
    return HostPort{ip.substr(0, colon), ip.substr(colon + 1)};
}

// ---------------------------------------------------------------------------
// resolve_until()
// ---------------
// Numeric addresses skip DNS. Host names go through the resolver with a
// steady_timer racing it; the timer handler owns shared copies of the
// resolver and the flag, so it stays valid if it runs after we return.
// ---------------------------------------------------------------------------
Result<std::vector<tcp::endpoint>> resolve_until(AsyncContext& ctx, const HostPort& hp,
                                                 std::chrono::steady_clock::time_point deadline,
                                                 const std::string& ip,
                                                 const std::string& timeout_message) {
    char* end = nullptr;
    unsigned long port = std::strtoul(hp.port.c_str(), &end, 10);
    if (hp.port.empty() || *end != '\0' || port > 65535)
        return transport_error(ip, "invalid port '" + hp.port + "'");

    beast::error_code ec;
    auto addr = net::ip::make_address(hp.host, ec);
    if (!ec) return std::vector<tcp::endpoint>{tcp::endpoint(addr, static_cast<unsigned short>(port))};

    auto resolver  = std::make_shared<tcp::resolver>(ctx.io);
    auto timed_out = std::make_shared<bool>(false);

    net::steady_timer timer(ctx.io, deadline);
    timer.async_wait([resolver, timed_out](const beast::error_code& e) {
        if (e) return;                            // cancelled: resolve finished first
        *timed_out = true;
        resolver->cancel();
    });

    ec = {};
    auto results = resolver->async_resolve(hp.host, hp.port, ctx.yield[ec]);
    timer.cancel();

    if (*timed_out) return timeout_error(ip, timeout_message);
    if (ec) return transport_error(ip, "resolve failed: " + ec.message());

    std::vector<tcp::endpoint> out;
    for (const auto& entry : results) out.push_back(entry.endpoint());
    return out;
}

DeviceConnection::DeviceConnection(Passkey, net::io_context& io, std::string ip,
                                   std::chrono::milliseconds cmd_timeout)
    : ip_(std::move(ip)), cmd_timeout_(cmd_timeout), ws_(io) {}


// ---------------------------------------------------------------------------
// connect()
// ---------
// resolve -> TCP connect -> WebSocket handshake on /ws, all under one 5 s
// deadline (resolve_until, then the tcp_stream expiry). The deadline is
// cleared once the session is up; each command then sets its own.
// ---------------------------------------------------------------------------
Result<std::unique_ptr<DeviceConnection>> DeviceConnection::connect(AsyncContext& ctx,
                                                                    const std::string& ip,
                                                                    std::chrono::milliseconds cmd_timeout) {
    auto conn = std::make_unique<DeviceConnection>(Passkey{}, ctx.io, ip, cmd_timeout);
    const HostPort hp = split_host_port(ip);
    const auto deadline = std::chrono::steady_clock::now() + kConnectTimeout;
    beast::error_code ec;

    spdlog::debug("ws: connecting to ws://{}/ws", ip);

    auto endpoints = resolve_until(ctx, hp, deadline, ip, "Connection timeout to " + ip);
    if (!endpoints) return endpoints.error();

    auto& tcp_layer = beast::get_lowest_layer(conn->ws_);
    tcp_layer.expires_at(deadline);
    tcp_layer.async_connect(endpoints.value(), ctx.yield[ec]);
    if (ec == beast::error::timeout) return timeout_error(ip, "Connection timeout to " + ip);
    if (ec) return transport_error(ip, "WebSocket connect to ws://" + ip + "/ws failed: " + ec.message());

    conn->ws_.async_handshake(hp.host + ":" + hp.port, "/ws", ctx.yield[ec]);
    if (ec == beast::error::timeout) return timeout_error(ip, "Connection timeout to " + ip);
    if (ec) return transport_error(ip, "WebSocket handshake with " + ip + " failed: " + ec.message());

    tcp_layer.expires_never();
    conn->open_ = true;
    return std::move(conn);
}


// ---------------------------------------------------------------------------
// send_raw()
// ----------
// Write one text frame, then read frames until the first text frame.
// The command deadline covers both the write and the wait.
// ---------------------------------------------------------------------------
Result<std::string> DeviceConnection::send_raw(AsyncContext& ctx, const std::string& command) {
    if (!open_) return transport_error(ip_, "connection is closed");

    beast::error_code ec;
    auto& tcp_layer = beast::get_lowest_layer(ws_);
    tcp_layer.expires_after(cmd_timeout_);

    spdlog::debug("ws: {} <- {}", ip_, command);

    ws_.text(true);
    ws_.async_write(net::buffer(command), ctx.yield[ec]);
    if (ec) {
        open_ = false;
        if (ec == beast::error::timeout) return timeout_error(ip_, "Command to " + ip_ + " timed out");
        return transport_error(ip_, "WebSocket send error: " + ec.message());
    }

    std::string reply;
    beast::flat_buffer buf;
    for (;;) {
        ws_.async_read(buf, ctx.yield[ec]);
        if (ec == websocket::error::closed) {
            open_ = false;
            return invalid_response(ip_, "No response received for command '" + command + "'");
        }
        if (ec == beast::error::timeout) {
            open_ = false;
            return timeout_error(ip_, "Command to " + ip_ + " timed out");
        }
        if (ec) {
            open_ = false;
            return transport_error(ip_, "WebSocket error: " + ec.message());
        }
        if (ws_.got_text()) {
            reply = beast::buffers_to_string(buf.data());
            break;
        }
        buf.consume(buf.size());                  // binary frame: not a reply
    }
    tcp_layer.expires_never();

    spdlog::debug("ws: {} -> {}", ip_, reply);

    if (auto msg = classify_response(reply))
        return protocol_error(ip_, *msg);
    return reply;
}

Result<CommandResponse> DeviceConnection::send(AsyncContext& ctx, const std::string& command) {
    auto raw = send_raw(ctx, command);
    if (!raw) return raw.error();
    return parse_command_response(command, raw.value(), ip_);
}

Result<std::vector<CommandResponse>> DeviceConnection::send_batch(AsyncContext& ctx,
                                                                  const std::vector<std::string>& commands) {
    std::vector<CommandResponse> out;
    out.reserve(commands.size());
    for (const auto& cmd : commands) {
        auto r = send(ctx, cmd);
        if (!r) return r.error();
        out.push_back(std::move(r.value()));
    }
    return out;
}

Status DeviceConnection::close(AsyncContext& ctx) {
    if (!open_) return {};
    open_ = false;

    beast::error_code ec;
    beast::get_lowest_layer(ws_).expires_after(cmd_timeout_);
    ws_.async_close(websocket::close_code::normal, ctx.yield[ec]);
    if (ec && ec != websocket::error::closed)
        return transport_error(ip_, "WebSocket close failed: " + ec.message());
    return {};
}


// ---------------------------------------------------------------------------
// One-shot helpers. Close failures after a good reply are logged only: the
// device already answered.
// ---------------------------------------------------------------------------

static void close_quietly(AsyncContext& ctx, DeviceConnection& conn) {
    if (auto st = conn.close(ctx); !st)
        spdlog::debug("ws: {}", st.error().message);
}

Result<std::string> send_command(AsyncContext& ctx, const std::string& ip,
                                 const std::string& command,
                                 std::chrono::milliseconds timeout) {
    auto conn = DeviceConnection::connect(ctx, ip, timeout);
    if (!conn) return conn.error();
    auto r = conn.value()->send_raw(ctx, command);
    close_quietly(ctx, *conn.value());
    return r;
}

Result<CommandResponse> send_command_parsed(AsyncContext& ctx, const std::string& ip,
                                            const std::string& command,
                                            std::chrono::milliseconds timeout) {
    auto raw = send_command(ctx, ip, command, timeout);
    if (!raw) return raw.error();
    return parse_command_response(command, raw.value(), ip);
}

Result<std::vector<CommandResponse>> send_commands(AsyncContext& ctx, const std::string& ip,
                                                   const std::vector<std::string>& commands,
                                                   std::chrono::milliseconds timeout) {
    auto conn = DeviceConnection::connect(ctx, ip, timeout);
    if (!conn) return conn.error();
    auto r = conn.value()->send_batch(ctx, commands);
    close_quietly(ctx, *conn.value());
    return r;
}

Result<std::string> send_command_with_retry(AsyncContext& ctx, const std::string& ip,
                                            const std::string& command,
                                            std::chrono::milliseconds timeout,
                                            std::size_t max_retries) {
    Result<std::string> last = send_command(ctx, ip, command, timeout);
    for (std::size_t attempt = 1; attempt <= max_retries && !last; ++attempt) {
        if (last.error().kind == ErrorKind::Validation) break;
        spdlog::debug("ws: retry {}/{} for {}: {}", attempt, max_retries, ip, last.error().message);
        async_sleep(ctx, kRetryDelay);
        last = send_command(ctx, ip, command, timeout);
    }
    return last;
}

} // namespace rtlslink
