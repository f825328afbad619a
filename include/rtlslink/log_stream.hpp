#pragma once
/**
 * @page rl-logs RTLS-Link Device Log Stream
 * @file log_stream.hpp
 * @brief Receive and filter the JSON log records devices send over UDP.
 *
 * @details
 * PURPOSE
 * -------
 * With UDP logging enabled (wifi.logUdpEnabled), a device sends each log line
 * as one datagram to the log port (default 3334):
 *
 *   {"ts":12345,"lvl":"INFO","tag":"app.cpp","msg":"Hello world"}
 *
 * FIELDS
 * ------
 * - ts:  device uptime in ms. "timestamp" is accepted as an alias.
 * - lvl: "ERROR" | "WARN" | "INFO" | "DEBUG" | "VERBOSE" (any case), or the
 *        numbers 1..5 in that order. Anything else reads as Info and the
 *        original text is kept in level_name.
 * - tag: source tag, usually the firmware file name.
 * - msg: the text. "message" is accepted as an alias.
 *
 * FILTERING
 * ---------
 * LogFilter keeps a record when all of its set conditions hold: exact device
 * IP, severity at or above min_level (Error is most severe), tag matching a
 * glob with `*` and `?`.
 *
 * RECEIVER
 * --------
 * LogReceiver owns a UdpListener (port reuse on, so it can share the port
 * with a GUI) and mirrors DiscoveryService: step() handles at most one
 * datagram, run() loops until the CancelToken trips.
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "rtlslink/cancel.hpp"
#include "rtlslink/error.hpp"
#include "rtlslink/udp_listener.hpp"

namespace rtlslink {

constexpr uint16_t kDefaultLogPort = 3334;

enum class LogLevel : uint8_t {
    Error   = 1,
    Warn    = 2,
    Info    = 3,
    Debug   = 4,
    Verbose = 5
};

const char* to_string(LogLevel level);

/// "warn", "WARNING", "3", ... -> LogLevel. nullopt if unrecognized.
std::optional<LogLevel> parse_log_level(const std::string& s);

struct LogRecord {
    std::string device_ip;
    uint64_t    ts{0};
    LogLevel    level{LogLevel::Info};
    std::string level_name;     ///< as sent by the device
    std::string tag;
    std::string msg;
};

void to_json(nlohmann::json& j, const LogRecord& r);

/// One datagram -> LogRecord. Invalid JSON or a non-object is a Decode error.
Result<LogRecord> parse_log_record(const uint8_t* data, std::size_t len, const std::string& ip);
Result<LogRecord> parse_log_record(const std::string& payload, const std::string& ip);

/// `*` matches any run, `?` one character. Whole-string match.
bool glob_match(const std::string& pattern, const std::string& text);

struct LogFilter {
    std::optional<std::string> ip;
    LogLevel                   min_level{LogLevel::Verbose};   ///< Verbose = everything
    std::optional<std::string> tag_glob;

    bool matches(const LogRecord& r) const;
};

/// "<ts> <ip> <LEVEL> [tag] msg" for terminal output.
std::string format_log_line(const LogRecord& r);

class LogReceiver {
public:
    using RecordFn = std::function<void(const LogRecord&)>;

    explicit LogReceiver(uint16_t port = kDefaultLogPort, bool reuse_port = true)
        : port_(port), reuse_port_(reuse_port) {}

    Status start();
    uint16_t port() const { return listener_ ? listener_->port() : 0; }

    /// Wait up to timeout_ms for one datagram. True if a record was delivered.
    bool step(const LogFilter& filter, const RecordFn& on_record, int timeout_ms = 500);

    Status run(const LogFilter& filter, const RecordFn& on_record, const CancelToken& cancel);

private:
    uint16_t                   port_;
    bool                       reuse_port_;
    std::optional<UdpListener> listener_;
};

} // namespace rtlslink
