// ============================================================================
// log_stream.cpp - implementation for log_stream.hpp
// ============================================================================

#include "rtlslink/log_stream.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace rtlslink {

using nlohmann::json;

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Warn:    return "WARN";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Verbose: return "VERBOSE";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string u(s);
    std::transform(u.begin(), u.end(), u.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (u == "ERROR" || u == "E" || u == "1")                    return LogLevel::Error;
    if (u == "WARN" || u == "WARNING" || u == "W" || u == "2")   return LogLevel::Warn;
    if (u == "INFO" || u == "I" || u == "3")                     return LogLevel::Info;
    if (u == "DEBUG" || u == "D" || u == "4")                    return LogLevel::Debug;
    if (u == "VERBOSE" || u == "V" || u == "TRACE" || u == "5")  return LogLevel::Verbose;
    return std::nullopt;
}

void to_json(json& j, const LogRecord& r) {
    j = json{
        {"deviceIp", r.device_ip},
        {"ts",       r.ts},
        {"lvl",      to_string(r.level)},
        {"tag",      r.tag},
        {"msg",      r.msg},
    };
}

// First of the given keys that holds a string.
static std::string first_string(const json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = j.find(k);
        if (it != j.end() && it->is_string()) return it->get<std::string>();
    }
    return {};
}

Result<LogRecord> parse_log_record(const uint8_t* data, std::size_t len, const std::string& ip) {
    json j = json::parse(data, data + len, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) return decode_error("log record is not valid JSON", ip);
    if (!j.is_object())   return decode_error("log record is not a JSON object", ip);

    LogRecord r;
    r.device_ip = ip;

    for (const char* k : {"ts", "timestamp"}) {
        auto it = j.find(k);
        if (it != j.end() && it->is_number_unsigned()) { r.ts = it->get<uint64_t>(); break; }
        if (it != j.end() && it->is_number_integer() && it->get<int64_t>() >= 0) {
            r.ts = static_cast<uint64_t>(it->get<int64_t>());
            break;
        }
    }

    if (auto it = j.find("lvl"); it != j.end()) {
        if (it->is_string()) {
            r.level_name = it->get<std::string>();
            r.level      = parse_log_level(r.level_name).value_or(LogLevel::Info);
        } else if (it->is_number_integer()) {
            auto n = it->get<int64_t>();
            r.level_name = std::to_string(n);
            if (n >= 1 && n <= 5) r.level = static_cast<LogLevel>(n);
        }
    }
    if (r.level_name.empty()) r.level_name = to_string(r.level);

    r.tag = first_string(j, {"tag"});
    r.msg = first_string(j, {"msg", "message"});
    return r;
}

Result<LogRecord> parse_log_record(const std::string& payload, const std::string& ip) {
    return parse_log_record(reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), ip);
}

// Iterative glob with single-star backtracking.
bool glob_match(const std::string& pattern, const std::string& text) {
    std::size_t p = 0, t = 0;
    std::size_t star = std::string::npos, mark = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p; ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool LogFilter::matches(const LogRecord& r) const {
    if (ip && *ip != r.device_ip) return false;
    if (static_cast<uint8_t>(r.level) > static_cast<uint8_t>(min_level)) return false;
    if (tag_glob && !glob_match(*tag_glob, r.tag)) return false;
    return true;
}

std::string format_log_line(const LogRecord& r) {
    return fmt::format("{:>10} {:<15} {:<7} [{}] {}", r.ts, r.device_ip, to_string(r.level), r.tag, r.msg);
}


// ---------------------------------------------------------------------------
// LogReceiver
// ---------------------------------------------------------------------------

Status LogReceiver::start() {
    if (listener_) return {};
    auto bound = UdpListener::bind(port_, UdpOptions{reuse_port_});
    if (!bound) {
        spdlog::error("logs: cannot bind udp/{}: {}", port_, bound.error().message);
        return bound.error();
    }
    listener_.emplace(std::move(bound.value()));
    spdlog::info("logs: listening on udp/{}", listener_->port());
    return {};
}

bool LogReceiver::step(const LogFilter& filter, const RecordFn& on_record, int timeout_ms) {
    if (!listener_) return false;

    auto r = listener_->receive(timeout_ms);
    if (!r) {
        spdlog::warn("logs: receive failed: {}", r.error().message);
        return false;
    }
    if (!r.value()) return false;

    const Datagram& d = *r.value();
    auto rec = parse_log_record(d.data.data(), d.data.size(), d.from_ip);
    if (!rec) {
        spdlog::debug("logs: dropped packet from {}: {}", d.from_ip, rec.error().message);
        return false;
    }
    if (!filter.matches(rec.value())) return false;
    if (on_record) on_record(rec.value());
    return true;
}

Status LogReceiver::run(const LogFilter& filter, const RecordFn& on_record, const CancelToken& cancel) {
    if (auto st = start(); !st) return st;
    while (!cancel.cancelled())
        step(filter, on_record);
    return {};
}

} // namespace rtlslink
