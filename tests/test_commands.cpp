#include <doctest/doctest.h>
#include "rtlslink/commands.hpp"

using namespace rtlslink;

TEST_CASE("parameter command strings") {
    CHECK(commands::read_all() == "readall all");
    CHECK(commands::read_all(std::string("wifi")) == "readall wifi");
    CHECK(commands::read_param("uwb", "mode") == "read -group uwb -name mode");
    CHECK(commands::write_param("wifi", "ssidST", "MyNet") == "write -group wifi -name ssidST -data \"MyNet\"");
}

TEST_CASE("write_param escapes quotes and backslashes") {
    CHECK(commands::write_param("wifi", "pswdST", "pass\"word") ==
          "write -group wifi -name pswdST -data \"pass\\\"word\"");
    // backslash is escaped before the quote, so "\" becomes "\\" not "\\\""
    CHECK(commands::escape_value("a\\b") == "a\\\\b");
    CHECK(commands::escape_value("\\\"") == "\\\\\\\"");
}

TEST_CASE("config and control command strings") {
    CHECK(commands::backup_config() == "backup-config");
    CHECK(commands::save_config() == "save-config");
    CHECK(commands::load_config() == "load-config");
    CHECK(commands::list_configs() == "list-configs");
    CHECK(commands::save_config_as("field-a") == "save-config-as -name field-a");
    CHECK(commands::load_config_named("x") == "load-config-named -name x");
    CHECK(commands::read_config_named("x") == "read-config-named -name x");
    CHECK(commands::delete_config("x") == "delete-config -name x");
    CHECK(commands::toggle_led() == "toggle-led2");
    CHECK(commands::get_led_state() == "get-led2-state");
    CHECK(commands::reboot() == "reboot");
    CHECK(commands::start() == "start");
    CHECK(commands::get_version() == "version");
    CHECK(commands::get_firmware_info() == "firmware-info");
}

TEST_CASE("JSON-class commands") {
    CHECK(commands::expects_json("backup-config"));
    CHECK(commands::expects_json("list-configs"));
    CHECK(commands::expects_json("save-config-as -name test"));
    CHECK(commands::expects_json("firmware-info"));
    CHECK_FALSE(commands::expects_json("version"));
    CHECK_FALSE(commands::expects_json("reboot"));
    CHECK_FALSE(commands::expects_json("save-config"));
    CHECK_FALSE(commands::expects_json(""));
}

TEST_CASE("JSON-class match is a plain prefix of the command") {
    CHECK(commands::expects_json("backup-config-full"));
    CHECK(commands::expects_json("firmware-info2"));
    CHECK(commands::expects_json("read-config-named -name cfg1"));
    CHECK_FALSE(commands::expects_json(" backup-config"));
    CHECK_FALSE(commands::expects_json("backup"));
}
