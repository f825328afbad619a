#pragma once
/**
 * @page rl-connection RTLS-Link Command Channel
 * @file device_connection.hpp
 * @brief WebSocket command channel to one device (`ws://ip/ws`).
 *
 * @details
 * PURPOSE
 * -------
 * Every configuration and control action is a plaintext command sent as one
 * WebSocket text frame. The first text frame that comes back is the reply.
 *
 * ONE IMPLEMENTATION, TWO SHAPES
 * ------------------------------
 * - DeviceConnection: a persistent session. connect() once, then send_raw(),
 *   send() or send_batch() any number of times, then close(). Used for
 *   multi-command work such as applying a whole config.
 * - send_command() and friends: connect + one command + close. These are thin
 *   wrappers over DeviceConnection, so both shapes behave identically.
 *
 * TIMEOUTS
 * --------
 * - Connect (TCP + WebSocket handshake): fixed 5 s.
 * - Per command (write + wait for reply): the caller's cmd_timeout,
 *   typically 5000 ms. Expiry gives ErrorKind::Timeout and leaves the
 *   connection unusable.
 *
 * REPLY RULES
 * -----------
 * - Binary frames are skipped. Ping/pong/close are handled by Beast and never
 *   count as a reply.
 * - A close before any text frame is InvalidResponse ("No response received").
 * - Every reply goes through classify_response() (response.hpp). A failure
 *   reply becomes a Protocol error carrying the device's message.
 * - Commands within one connection are strictly sequential.
 *
 * ADDRESSING
 * ----------
 * `ip` may carry a port ("127.0.0.1:8081"); the default is 80.
 */

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "rtlslink/error.hpp"
#include "rtlslink/response.hpp"
#include "rtlslink/runtime.hpp"

namespace rtlslink {

constexpr std::chrono::milliseconds kConnectTimeout{5000};
constexpr std::chrono::milliseconds kDefaultCommandTimeout{5000};
constexpr std::chrono::milliseconds kRetryDelay{500};

/// "host[:port]" split. Port defaults to default_port.
struct HostPort {
    std::string host;
    std::string port;
};
HostPort split_host_port(const std::string& ip, const char* default_port = "80");

/**
 * @brief host:port -> endpoints, giving up at deadline.
 *
 * Numeric addresses (the usual case for devices) never touch DNS. Host names
 * use the resolver with a timer that cancels it at deadline. Expiry is a
 * Timeout carrying `timeout_message`; anything else is Transport. `ip` tags
 * the error.
 */
Result<std::vector<net::ip::tcp::endpoint>> resolve_until(AsyncContext& ctx, const HostPort& hp,
                                                          std::chrono::steady_clock::time_point deadline,
                                                          const std::string& ip,
                                                          const std::string& timeout_message);

class DeviceConnection {
    struct Passkey { explicit Passkey() = default; };

public:
    using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    /// Only connect() can build one.
    DeviceConnection(Passkey, net::io_context& io, std::string ip, std::chrono::milliseconds cmd_timeout);

    /// Open a session. Connect failures are Transport, connect expiry is Timeout.
    static Result<std::unique_ptr<DeviceConnection>> connect(AsyncContext& ctx,
                                                             const std::string& ip,
                                                             std::chrono::milliseconds cmd_timeout);

    /// Send one command, return the classified raw reply text.
    Result<std::string> send_raw(AsyncContext& ctx, const std::string& command);

    /// send_raw() plus JSON extraction for JSON-class commands.
    Result<CommandResponse> send(AsyncContext& ctx, const std::string& command);

    /// Sequential send(); the first failure aborts the rest.
    Result<std::vector<CommandResponse>> send_batch(AsyncContext& ctx,
                                                    const std::vector<std::string>& commands);

    /// Send a normal close frame. Safe to call more than once.
    Status close(AsyncContext& ctx);

    const std::string& ip() const { return ip_; }
    bool is_open() const { return open_; }

private:
    std::string               ip_;
    std::chrono::milliseconds cmd_timeout_;
    WsStream                  ws_;
    bool                      open_{false};
};

// -------------------------------- one-shot --------------------------------

/// Connect, send one command, close. Reply text is classified.
Result<std::string> send_command(AsyncContext& ctx, const std::string& ip,
                                 const std::string& command,
                                 std::chrono::milliseconds timeout);

/// Same, with JSON extraction for JSON-class commands.
Result<CommandResponse> send_command_parsed(AsyncContext& ctx, const std::string& ip,
                                            const std::string& command,
                                            std::chrono::milliseconds timeout);

/// One connection, commands sent in order, first failure aborts.
Result<std::vector<CommandResponse>> send_commands(AsyncContext& ctx, const std::string& ip,
                                                   const std::vector<std::string>& commands,
                                                   std::chrono::milliseconds timeout);

/**
 * @brief send_command() with up to max_retries extra attempts.
 *
 * Waits kRetryDelay (500 ms) between attempts. Returns the last error.
 */
Result<std::string> send_command_with_retry(AsyncContext& ctx, const std::string& ip,
                                            const std::string& command,
                                            std::chrono::milliseconds timeout,
                                            std::size_t max_retries);

} // namespace rtlslink
