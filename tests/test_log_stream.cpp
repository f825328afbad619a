#include <doctest/doctest.h>
#include "rtlslink/log_stream.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

using namespace rtlslink;

// Fire one datagram at 127.0.0.1:port from a throwaway socket.
static void send_udp(uint16_t port, const std::string& payload) {
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

TEST_CASE("log level names, letters and digits") {
    CHECK(parse_log_level("warn") == LogLevel::Warn);
    CHECK(parse_log_level("WARNING") == LogLevel::Warn);
    CHECK(parse_log_level("d") == LogLevel::Debug);
    CHECK(parse_log_level("1") == LogLevel::Error);
    CHECK(parse_log_level("trace") == LogLevel::Verbose);
    CHECK_FALSE(parse_log_level("loud").has_value());
    CHECK(std::string(to_string(LogLevel::Verbose)) == "VERBOSE");
}

TEST_CASE("log record fields and aliases") {
    auto r = parse_log_record(R"({"ts":12345,"lvl":"WARN","tag":"uwb","msg":"anchor lost"})", "10.0.0.8");
    REQUIRE(r.ok());
    CHECK(r.value().device_ip == "10.0.0.8");
    CHECK(r.value().ts == 12345);
    CHECK(r.value().level == LogLevel::Warn);
    CHECK(r.value().tag == "uwb");
    CHECK(r.value().msg == "anchor lost");

    auto a = parse_log_record(R"({"timestamp":7,"lvl":4,"message":"hello"})", "10.0.0.8");
    REQUIRE(a.ok());
    CHECK(a.value().ts == 7);
    CHECK(a.value().level == LogLevel::Debug);
    CHECK(a.value().msg == "hello");
    CHECK(a.value().tag.empty());
}

TEST_CASE("unknown level text is kept but counts as info") {
    auto r = parse_log_record(R"({"lvl":"NOTICE","msg":"x"})", "ip");
    REQUIRE(r.ok());
    CHECK(r.value().level == LogLevel::Info);
    CHECK(r.value().level_name == "NOTICE");
}

TEST_CASE("malformed log datagrams are decode errors") {
    CHECK(parse_log_record("garbage", "ip").error().kind == ErrorKind::Decode);
    CHECK_FALSE(parse_log_record("\"text\"", "ip").ok());
}

TEST_CASE("glob matching") {
    CHECK(glob_match("uwb*", "uwb_tdoa"));
    CHECK(glob_match("*", ""));
    CHECK(glob_match("w?fi", "wifi"));
    CHECK(glob_match("*ta*", "mavlink_tag"));
    CHECK_FALSE(glob_match("uwb", "uwb_tdoa"));
    CHECK_FALSE(glob_match("?", ""));
}

TEST_CASE("filter by ip, level and tag") {
    LogRecord r;
    r.device_ip = "10.0.0.8";
    r.level = LogLevel::Debug;
    r.tag = "uwb_range";

    LogFilter all;
    CHECK(all.matches(r));

    LogFilter info;
    info.min_level = LogLevel::Info;
    CHECK_FALSE(info.matches(r));
    r.level = LogLevel::Error;
    CHECK(info.matches(r));

    LogFilter by_ip;
    by_ip.ip = "10.0.0.9";
    CHECK_FALSE(by_ip.matches(r));

    LogFilter by_tag;
    by_tag.tag_glob = "uwb*";
    CHECK(by_tag.matches(r));
    by_tag.tag_glob = "wifi*";
    CHECK_FALSE(by_tag.matches(r));
}

TEST_CASE("log record JSON output") {
    LogRecord r;
    r.device_ip = "10.0.0.8";
    r.ts = 99;
    r.level = LogLevel::Error;
    r.tag = "ota";
    r.msg = "boom";
    nlohmann::json j = r;
    CHECK(j["deviceIp"] == "10.0.0.8");
    CHECK(j["lvl"] == "ERROR");
    CHECK(j["ts"] == 99);
    CHECK(format_log_line(r).find("[ota] boom") != std::string::npos);
}

TEST_CASE("receiver delivers filtered records from loopback") {
    LogReceiver rx(0, false);
    REQUIRE(rx.start().ok());
    REQUIRE(rx.port() != 0);

    LogFilter filter;
    filter.min_level = LogLevel::Warn;

    std::vector<LogRecord> got;
    auto on_record = [&](const LogRecord& r) { got.push_back(r); };

    send_udp(rx.port(), R"({"ts":1,"lvl":"DEBUG","tag":"t","msg":"quiet"})");
    CHECK_FALSE(rx.step(filter, on_record, 1000));

    send_udp(rx.port(), R"({"ts":2,"lvl":"ERROR","tag":"t","msg":"loud"})");
    CHECK(rx.step(filter, on_record, 1000));

    REQUIRE(got.size() == 1);
    CHECK(got[0].msg == "loud");
    CHECK(got[0].device_ip == "127.0.0.1");
}
