#pragma once
/**
 * @page rl-commands RTLS-Link Command Builders
 * @file commands.hpp
 * @brief Builders for the plaintext commands an RTLS-Link device accepts over WebSocket.
 *
 * @details
 * PURPOSE
 * -------
 * The device speaks a small line-oriented command language on `ws://ip/ws`.
 * Every request is one text frame, for example:
 *
 *   readall all
 *   read -group wifi -name ssidST
 *   write -group wifi -name pswdST -data "pass\"word"
 *   save-config-as -name field-a
 *
 * This header keeps those strings in one place. Each builder is explicit and
 * hand-written, so the supported surface is obvious at a glance. Callers never
 * assemble command text themselves.
 *
 * REPLIES
 * -------
 * Most commands reply with a short text line ("OK", "Error: ..."). A fixed set
 * replies with JSON; expects_json() answers which, and response.hpp uses it to
 * decide whether a missing JSON payload is an error.
 *
 * QUOTING
 * -------
 * write_param() wraps the value in double quotes after escaping backslash
 * first and then double quote. Group and name are never quoted.
 */

#include <optional>
#include <string>

namespace rtlslink {

/// One device parameter as read by `readall` or written by `write`.
struct ConfigParam {
    std::string group;
    std::string name;
    std::string value;
};

inline bool operator==(const ConfigParam& a, const ConfigParam& b) {
    return a.group == b.group && a.name == b.name && a.value == b.value;
}

namespace commands {

// ------------------------------ parameters ------------------------------

/// "readall all" or "readall <group>".
std::string read_all(const std::optional<std::string>& group = std::nullopt);

/// "read -group G -name N".
std::string read_param(const std::string& group, const std::string& name);

/// "write -group G -name N -data \"V\"" with V escaped.
std::string write_param(const std::string& group, const std::string& name, const std::string& value);

/// Escape `\` then `"` for use inside a quoted -data argument.
std::string escape_value(const std::string& value);

// ------------------------------ configs ---------------------------------

std::string backup_config();                                 ///< "backup-config" (JSON reply)
std::string save_config();                                   ///< "save-config"
std::string load_config();                                   ///< "load-config"
std::string list_configs();                                  ///< "list-configs" (JSON reply)
std::string save_config_as(const std::string& name);         ///< "save-config-as -name X"
std::string load_config_named(const std::string& name);      ///< "load-config-named -name X"
std::string read_config_named(const std::string& name);      ///< "read-config-named -name X"
std::string delete_config(const std::string& name);          ///< "delete-config -name X"

// ------------------------------ control ---------------------------------

std::string toggle_led();          ///< "toggle-led2"
std::string get_led_state();       ///< "get-led2-state"
std::string reboot();              ///< "reboot"
std::string start();               ///< "start"
std::string get_version();         ///< "version"
std::string get_firmware_info();   ///< "firmware-info" (JSON reply)

/**
 * @brief True if the device answers this command with a JSON payload.
 *
 * Prefix match, so "read-config-named -name x" counts.
 */
bool expects_json(const std::string& command);

} // namespace commands
} // namespace rtlslink
