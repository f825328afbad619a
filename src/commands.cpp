// ============================================================================
// commands.cpp - implementation for commands.hpp
// ============================================================================

#include "rtlslink/commands.hpp"

#include <cstring>

namespace rtlslink {
namespace commands {

// Commands whose reply carries JSON.
static const char* const kJsonCommands[] = {
    "backup-config",
    "list-configs",
    "save-config-as",
    "load-config-named",
    "read-config-named",
    "delete-config",
    "toggle-led2",
    "get-led2-state",
    "firmware-info",
};

static std::string named(const char* verb, const std::string& name) {
    return std::string(verb) + " -name " + name;
}

std::string read_all(const std::optional<std::string>& group) {
    return "readall " + (group ? *group : std::string("all"));
}

std::string read_param(const std::string& group, const std::string& name) {
    return "read -group " + group + " -name " + name;
}

std::string escape_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 4);
    for (char c : value) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string write_param(const std::string& group, const std::string& name, const std::string& value) {
    return "write -group " + group + " -name " + name + " -data \"" + escape_value(value) + "\"";
}

std::string backup_config()  { return "backup-config"; }
std::string save_config()    { return "save-config"; }
std::string load_config()    { return "load-config"; }
std::string list_configs()   { return "list-configs"; }

std::string save_config_as(const std::string& name)    { return named("save-config-as", name); }
std::string load_config_named(const std::string& name) { return named("load-config-named", name); }
std::string read_config_named(const std::string& name) { return named("read-config-named", name); }
std::string delete_config(const std::string& name)     { return named("delete-config", name); }

std::string toggle_led()        { return "toggle-led2"; }
std::string get_led_state()     { return "get-led2-state"; }
std::string reboot()            { return "reboot"; }
std::string start()             { return "start"; }
std::string get_version()       { return "version"; }
std::string get_firmware_info() { return "firmware-info"; }

bool expects_json(const std::string& command) {
    for (const char* j : kJsonCommands)
        if (command.compare(0, std::strlen(j), j) == 0) return true;
    return false;
}

} // namespace commands
} // namespace rtlslink
