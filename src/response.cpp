// ============================================================================
// response.cpp - implementation for response.hpp
// ============================================================================

#include "rtlslink/response.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rtlslink {

using nlohmann::json;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static bool has(const std::string& hay, const char* needle) {
    return hay.find(needle) != std::string::npos;
}

// Earliest '{' or '['; npos if neither.
static std::size_t json_start(const std::string& reply) {
    return std::min(reply.find('{'), reply.find('['));
}

// Parse from json_start() to end; discarded value on failure, never throws.
static json parse_tail(const std::string& reply, std::size_t start) {
    return json::parse(reply.begin() + static_cast<std::ptrdiff_t>(start), reply.end(),
                       nullptr, /*allow_exceptions*/false);
}

static std::string string_or_unknown(const json& v) {
    return v.is_string() ? v.get<std::string>() : std::string("Unknown error");
}


std::optional<std::string> classify_response(const std::string& reply) {
    const std::string lc = lower(reply);

    // 1) explicit "error:" marker
    if (auto pos = lc.find("error:"); pos != std::string::npos)
        return trim(reply.substr(pos + 6));

    // 2) failure words without a success word
    bool bad_word = has(lc, "error") || has(lc, "fail") || has(lc, "invalid") || has(lc, "not found");
    if (bad_word && !has(lc, "success"))
        return trim(reply);

    // 3) JSON status object
    auto start = json_start(reply);
    if (start == std::string::npos) return std::nullopt;

    json j = parse_tail(reply, start);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    if (auto s = j.find("success"); s != j.end() && s->is_boolean() && !s->get<bool>()) {
        if (auto m = j.find("message"); m != j.end()) return string_or_unknown(*m);
        if (auto e = j.find("error"); e != j.end())   return string_or_unknown(*e);
        return std::string("Command failed");
    }
    if (auto e = j.find("error"); e != j.end())
        return string_or_unknown(*e);

    return std::nullopt;
}

Result<json> extract_json(const std::string& reply, const std::string& ip) {
    auto start = json_start(reply);
    if (start == std::string::npos)
        return invalid_response(ip, "No JSON found in response");

    json j = parse_tail(reply, start);
    if (j.is_discarded())
        return invalid_response(ip, "Failed to parse JSON");
    return j;
}

Result<CommandResponse> parse_command_response(const std::string& command,
                                               const std::string& reply,
                                               const std::string& ip) {
    if (auto msg = classify_response(reply))
        return protocol_error(ip, *msg);

    CommandResponse out;
    out.raw = reply;
    if (commands::expects_json(command)) {
        auto j = extract_json(reply, ip);
        if (!j) return j.error();
        out.json = std::move(j.value());
    }
    return out;
}

std::vector<ConfigParam> parse_readall_response(const std::string& reply) {
    std::vector<ConfigParam> params;
    std::string group;

    std::istringstream in(reply);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
            group = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos || group.empty()) continue;   // before any header
        params.push_back(ConfigParam{group, trim(line.substr(0, eq)), trim(line.substr(eq + 1))});
    }
    return params;
}

} // namespace rtlslink
