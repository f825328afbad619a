// ============================================================================
// settings.cpp - implementation for settings.hpp
// ============================================================================

#include "rtlslink/settings.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace rtlslink {

using nlohmann::json;

fs::path default_config_dir() {
    if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
        return fs::path(x) / "rtlslink";
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / ".config" / "rtlslink";
}

fs::path default_settings_path() {
    return default_config_dir() / "settings.json";
}

// Overwrite dst with j[key] if it is an in-range unsigned integer.
template <typename T>
static void take_uint(const json& j, const char* key, T& dst) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer() || it->get<int64_t>() < 0 ||
        it->get<uint64_t>() > std::numeric_limits<T>::max()) {
        spdlog::warn("settings: '{}' must be a non-negative integer, keeping {}", key, dst);
        return;
    }
    dst = static_cast<T>(it->get<uint64_t>());
}

Result<Settings> settings_from_json(const std::string& text, Settings base) {
    json j = json::parse(text, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) return decode_error("settings file is not valid JSON");
    if (!j.is_object())   return decode_error("settings file must hold a JSON object");

    take_uint(j, "discovery_port",       base.discovery_port);
    take_uint(j, "log_port",             base.log_port);
    take_uint(j, "timeout_ms",           base.timeout_ms);
    take_uint(j, "concurrency",          base.concurrency);
    take_uint(j, "discovery_duration_s", base.discovery_duration_s);
    return base;
}

Result<Settings> load_settings(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("settings: {} not found, using defaults", path.string());
        return Settings{};
    }

    std::ifstream in(path);
    if (!in) return validation_error("cannot read settings file " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();

    auto s = settings_from_json(ss.str());
    if (!s) return decode_error(s.error().message + " (" + path.string() + ")");
    spdlog::debug("settings: loaded {}", path.string());
    return s;
}

void apply_env_overrides(Settings& s) {
    const char* v = std::getenv("RTLS_CLI_TIMEOUT");
    if (!v || !*v) return;
    char* end = nullptr;
    unsigned long long ms = std::strtoull(v, &end, 10);
    if (end == v || *end != '\0') {
        spdlog::warn("settings: ignoring RTLS_CLI_TIMEOUT='{}' (not a number)", v);
        return;
    }
    s.timeout_ms = ms;
}

} // namespace rtlslink
