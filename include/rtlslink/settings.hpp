#pragma once
/**
 * @file settings.hpp
 * @brief User settings: defaults, `settings.json` under the XDG config dir, env override.
 *
 * File: $XDG_CONFIG_HOME/rtlslink/settings.json (else ~/.config/rtlslink/).
 *
 * @code
 *   {
 *     "discovery_port": 3333,
 *     "log_port": 3334,
 *     "timeout_ms": 5000,
 *     "concurrency": 3,
 *     "discovery_duration_s": 3
 *   }
 * @endcode
 *
 * Precedence, lowest first: built-in defaults, the file, RTLS_CLI_TIMEOUT,
 * command-line flags (applied by the CLI itself). A missing file is not an
 * error. Unknown keys are ignored. A key of the wrong type keeps its default
 * and logs a warning. A file that is not JSON at all is a Decode error.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "rtlslink/error.hpp"

namespace rtlslink {

struct Settings {
    uint16_t    discovery_port{3333};
    uint16_t    log_port{3334};
    uint64_t    timeout_ms{5000};
    std::size_t concurrency{3};
    uint32_t    discovery_duration_s{3};
};

/// $XDG_CONFIG_HOME/rtlslink, or $HOME/.config/rtlslink.
std::filesystem::path default_config_dir();

/// default_config_dir() / "settings.json".
std::filesystem::path default_settings_path();

/// Defaults overlaid with the file at path (if it exists).
Result<Settings> load_settings(const std::filesystem::path& path);

/// Overlay settings from JSON text. Exposed for tests.
Result<Settings> settings_from_json(const std::string& text, Settings base = Settings{});

/// Apply RTLS_CLI_TIMEOUT (milliseconds) if set and numeric.
void apply_env_overrides(Settings& s);

} // namespace rtlslink
