/**
 * @file main.cpp
 * @brief rtlslink - host-side CLI for finding, configuring and updating RTLS-Link devices.
 *
 * Responsibilities:
 *  - Parse subcommands and global options (CLI11).
 *  - Load settings (~/.config/rtlslink/settings.json), then RTLS_CLI_TIMEOUT, then flags.
 *  - Resolve targets: an IP, a comma list, or "all" (UDP discovery, optional role filter).
 *  - Run the operation through the rtlslink core library and print text or --json.
 *  - Map failures to stable exit codes for scripts.
 *
 * Exit codes:
 *   0 ok, 1 general, 2 network/timeout, 3 device (command/OTA failed),
 *   4 invalid arguments, 5 partial failure (bulk, only with --strict).
 *
 * Notes:
 *  - Device commands contain dashes ("read -group wifi -name ssidST"). Quote
 *    them as one argument, or put them after "--".
 *  - SIGINT/SIGTERM trip a CancelToken; watch loops and bulk runs stop cleanly.
 */

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"
#include <spdlog/spdlog.h>

#include "rtlslink/batch.hpp"
#include "rtlslink/cancel.hpp"
#include "rtlslink/commands.hpp"
#include "rtlslink/config_params.hpp"
#include "rtlslink/device_connection.hpp"
#include "rtlslink/discovery.hpp"
#include "rtlslink/health.hpp"
#include "rtlslink/log_stream.hpp"
#include "rtlslink/logging.hpp"
#include "rtlslink/ota.hpp"
#include "rtlslink/settings.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace rtlslink;

namespace exit_code {
constexpr int kOk         = 0;
constexpr int kGeneral    = 1;
constexpr int kNetwork    = 2;
constexpr int kDevice     = 3;
constexpr int kInvalidArg = 4;
constexpr int kPartial    = 5;
} // namespace exit_code

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
  std::string yellow(const std::string& s) const { return enabled ? "\033[33m"+s+"\033[0m" : s; }
};

// Everything a subcommand needs after option parsing.
struct RunCtx {
  Settings    settings;
  bool        json_out{false};
  bool        strict{false};
  Ansi        ansi;
  CancelToken cancel;

  std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(settings.timeout_ms); }
};

static CancelToken* g_cancel = nullptr;

static void on_signal(int) {
  if (g_cancel) g_cancel->cancel();
}

// No SA_RESTART: poll() returns EINTR and loops re-check the token.
static void install_signal_handlers(CancelToken& token) {
  g_cancel = &token;
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static int exit_code_for(const Error& e) {
  switch (e.kind) {
    case ErrorKind::Transport:
    case ErrorKind::Timeout:         return exit_code::kNetwork;
    case ErrorKind::Protocol:
    case ErrorKind::InvalidResponse:
    case ErrorKind::OtaFailed:       return exit_code::kDevice;
    case ErrorKind::Validation:      return exit_code::kInvalidArg;
    case ErrorKind::Decode:
    case ErrorKind::Cancelled:       break;
  }
  return exit_code::kGeneral;
}

static int report(const RunCtx& rc, const Error& e) {
  if (rc.json_out) {
    std::cout << json{{"success", false}, {"kind", to_string(e.kind)}, {"ip", e.ip},
                      {"error", e.to_string()}}.dump(2) << "\n";
  } else {
    std::cerr << rc.ansi.red("error: ") << e.to_string() << "\n";
  }
  return exit_code_for(e);
}

static int invalid_args(const std::string& msg) {
  std::cerr << "error: " << msg << "\n";
  return exit_code::kInvalidArg;
}

static std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static std::string join_words(const std::vector<std::string>& words) {
  std::string out;
  for (const auto& w : words) {
    if (!out.empty()) out += ' ';
    out += w;
  }
  return out;
}

static std::string shorten(const std::string& s, std::size_t n = 100) {
  std::string t = trim(s);
  return t.size() > n ? t.substr(0, n) + "..." : t;
}

static bool role_matches(const Device& d, const std::string& role) {
  return role.empty() || role_to_string(d.role) == role;
}

static Result<std::vector<Device>> discover(const RunCtx& rc, const std::string& role) {
  auto found = discover_once(rc.settings.discovery_port,
                             std::chrono::seconds(rc.settings.discovery_duration_s), rc.cancel);
  if (!found) return found.error();
  std::vector<Device> out;
  for (auto& d : found.value())
    if (role_matches(d, role)) out.push_back(std::move(d));
  return out;
}

// "all" -> discovery (+ role filter); otherwise one IP or a comma list.
static Result<std::vector<std::string>> resolve_targets(const RunCtx& rc, const std::string& target,
                                                        const std::string& role) {
  if (target != "all") {
    auto ips = split_csv(target);
    if (ips.empty()) return validation_error("no target IPs given");
    return ips;
  }
  auto devs = discover(rc, role);
  if (!devs) return devs.error();
  std::vector<std::string> ips;
  for (const auto& d : devs.value()) ips.push_back(d.ip);
  if (ips.empty()) return validation_error("No devices found");
  return ips;
}

static void print_device_row(const Device& d, const Ansi& ansi) {
  std::cout << std::left << std::setw(16) << d.ip << " "
            << std::setw(12) << role_to_string(d.role) << " "
            << std::setw(14) << d.id << " "
            << std::setw(6) << d.uwb_short << " "
            << ansi.dim(d.firmware) << "\n";
}

static void print_device_table(const std::vector<Device>& devs, const Ansi& ansi) {
  std::cout << ansi.bold("IP               ROLE         ID             UWB    FW") << "\n";
  for (const auto& d : devs) print_device_row(d, ansi);
  std::cout << devs.size() << " device(s)\n";
}

template <typename T, typename Describe>
static int print_batch(const RunCtx& rc, const BatchResult<T>& res, Describe describe) {
  // items arrive in completion order; show them by ip
  std::vector<const BatchItem<T>*> rows;
  for (const auto& it : res.items) rows.push_back(&it);
  std::sort(rows.begin(), rows.end(), [](const BatchItem<T>* a, const BatchItem<T>* b) { return a->ip < b->ip; });

  if (rc.json_out) {
    json arr = json::array();
    for (const auto* p : rows) {
      const auto& it = *p;
      json row{{"ip", it.ip}, {"success", it.result.ok()}};
      if (it.result.ok()) row["response"] = describe(it);
      else                row["error"] = it.result.error().to_string();
      arr.push_back(std::move(row));
    }
    std::cout << json{{"results", arr}, {"succeeded", res.succeeded()}, {"failed", res.failed()},
                      {"outcome", to_string(res.outcome())}}.dump(2) << "\n";
  } else {
    for (const auto* p : rows) {
      const auto& it = *p;
      if (it.result.ok())
        std::cout << std::left << std::setw(16) << it.ip << " " << rc.ansi.green("OK  ") << " " << describe(it) << "\n";
      else
        std::cout << std::left << std::setw(16) << it.ip << " " << rc.ansi.red("FAIL") << " " << it.result.error().to_string() << "\n";
    }
    std::cout << res.succeeded() << "/" << res.total() << " succeeded\n";
  }

  switch (res.outcome()) {
    case BatchOutcome::Empty:          return exit_code::kGeneral;
    case BatchOutcome::AllSucceeded:   return exit_code::kOk;
    case BatchOutcome::AllFailed:      return exit_code_for(res.items.front().result.error());
    case BatchOutcome::PartialFailure: break;
  }
  return rc.strict ? exit_code::kPartial : exit_code::kOk;
}

// ---------- subcommands ----------

static int run_discover(RunCtx& rc, bool watch, const std::string& role) {
  if (!watch) {
    auto devs = discover(rc, role);
    if (!devs) return report(rc, devs.error());
    if (rc.json_out) std::cout << json(devs.value()).dump(2) << "\n";
    else             print_device_table(devs.value(), rc.ansi);
    return exit_code::kOk;
  }

  DiscoveryOptions opts;
  opts.port = rc.settings.discovery_port;
  DiscoveryService svc(opts);
  auto st = svc.run([&](const std::vector<Device>& all) {
    std::vector<Device> devs;
    for (const auto& d : all) if (role_matches(d, role)) devs.push_back(d);
    if (rc.json_out) {
      std::cout << json(devs).dump() << std::endl;
    } else {
      if (is_tty_stdout()) std::cout << "\033[2J\033[H";
      print_device_table(devs, rc.ansi);
      std::cout << std::flush;
    }
  }, rc.cancel);
  if (!st) return report(rc, st.error());
  return exit_code::kOk;
}

static int run_status(RunCtx& rc, const std::string& target, bool health) {
  auto devs = discover(rc, "");
  if (!devs) return report(rc, devs.error());

  std::vector<Device> picked;
  for (const auto& d : devs.value())
    if (target == "all" || d.ip == target) picked.push_back(d);
  if (picked.empty()) return report(rc, validation_error("No devices found matching " + target));

  if (rc.json_out) {
    json arr = json::array();
    for (const auto& d : picked) {
      json j = d;
      if (health) {
        auto h = calculate_device_health(d);
        j["health"] = {{"level", to_string(h.level)}, {"issues", h.issues}};
      }
      arr.push_back(std::move(j));
    }
    std::cout << arr.dump(2) << "\n";
    return exit_code::kOk;
  }

  for (const auto& d : picked) {
    std::cout << rc.ansi.bold(d.ip) << "  " << role_to_string(d.role) << "  id=" << d.id
              << "  mac=" << d.mac << "  uwb=" << d.uwb_short
              << "  mav=" << unsigned(d.mav_sys_id) << "  fw=" << d.firmware << "\n";
    if (d.sending_pos)  std::cout << "  sending_pos  " << (*d.sending_pos ? "yes" : "no") << "\n";
    if (d.anchors_seen) std::cout << "  anchors_seen " << unsigned(*d.anchors_seen) << "\n";
    if (d.origin_sent)  std::cout << "  origin_sent  " << (*d.origin_sent ? "yes" : "no") << "\n";
    if (d.rf_enabled)   std::cout << "  rangefinder  " << (*d.rf_enabled ? (d.rf_healthy && *d.rf_healthy ? "ok" : "enabled") : "off") << "\n";
    if (d.avg_rate_chz) std::cout << "  rate         " << (*d.avg_rate_chz / 100.0) << " Hz\n";
    if (health) {
      auto h = calculate_device_health(d);
      std::string lvl = to_string(h.level);
      if (h.level == HealthLevel::Healthy)       lvl = rc.ansi.green(lvl);
      else if (h.level == HealthLevel::Warning)  lvl = rc.ansi.yellow(lvl);
      else if (h.level == HealthLevel::Degraded) lvl = rc.ansi.red(lvl);
      std::cout << "  health       " << lvl << "\n";
      for (const auto& issue : h.issues) std::cout << "    - " << issue << "\n";
    }
  }
  return exit_code::kOk;
}

static int run_cmd(RunCtx& rc, const std::string& ip, const std::string& command, std::size_t retries) {
  auto r = run_blocking([&](AsyncContext& ctx) -> Result<CommandResponse> {
    auto raw = send_command_with_retry(ctx, ip, command, rc.timeout(), retries);
    if (!raw) return raw.error();
    return parse_command_response(command, raw.value(), ip);
  });
  if (!r) return report(rc, r.error());

  const CommandResponse& resp = r.value();
  if (rc.json_out) {
    json out{{"ip", ip}, {"success", true}, {"raw", resp.raw}};
    if (resp.json) out["json"] = *resp.json;
    std::cout << out.dump(2) << "\n";
  } else if (resp.json) {
    std::cout << resp.json->dump(2) << "\n";
  } else {
    std::cout << trim(resp.raw) << "\n";
  }
  return exit_code::kOk;
}

static int run_bulk(RunCtx& rc, const std::string& command, const std::string& ips_csv,
                    const std::string& role, std::size_t concurrency) {
  auto ips = resolve_targets(rc, ips_csv.empty() ? "all" : ips_csv, role);
  if (!ips) return report(rc, ips.error());

  if (!rc.json_out)
    std::cout << "Running '" << command << "' on " << ips.value().size() << " device(s)...\n";

  BatchSender sender(rc.settings.timeout_ms, concurrency);
  auto res = sender.send_to_all(ips.value(), command, rc.cancel);
  return print_batch(rc, res, [](const BatchItem<std::string>& it) { return shorten(it.result.value()); });
}

static int run_config_read(RunCtx& rc, const std::string& ip, const std::string& group) {
  std::optional<std::string> g;
  if (!group.empty()) g = group;
  const std::string command = commands::read_all(g);

  auto r = run_blocking([&](AsyncContext& ctx) { return send_command(ctx, ip, command, rc.timeout()); });
  if (!r) return report(rc, r.error());

  auto params = parse_readall_response(r.value());
  if (rc.json_out) {
    json out = json::object();
    for (const auto& p : params) out[p.group][p.name] = p.value;
    std::cout << out.dump(2) << "\n";
  } else {
    std::string last;
    for (const auto& p : params) {
      if (p.group != last) { std::cout << rc.ansi.bold("[" + p.group + "]") << "\n"; last = p.group; }
      std::cout << "  " << std::left << std::setw(24) << p.name << p.value << "\n";
    }
  }
  return exit_code::kOk;
}

static int run_config_write(RunCtx& rc, const std::string& ip, const std::string& group,
                            const std::string& name, const std::string& value, bool save) {
  std::vector<std::string> cmds{commands::write_param(group, name, value)};
  if (save) cmds.push_back(commands::save_config());

  auto r = run_blocking([&](AsyncContext& ctx) { return send_commands(ctx, ip, cmds, rc.timeout()); });
  if (!r) return report(rc, r.error());

  if (rc.json_out) std::cout << json{{"ip", ip}, {"success", true}}.dump(2) << "\n";
  else             std::cout << group << "." << name << " = " << value << (save ? " (saved)" : "") << "\n";
  return exit_code::kOk;
}

static int run_config_backup(RunCtx& rc, const std::string& ip, const std::string& out_path) {
  auto r = run_blocking([&](AsyncContext& ctx) {
    return send_command_parsed(ctx, ip, commands::backup_config(), rc.timeout());
  });
  if (!r) return report(rc, r.error());

  const json& cfg = *r.value().json;
  if (out_path.empty()) {
    std::cout << cfg.dump(2) << "\n";
    return exit_code::kOk;
  }
  std::ofstream out(out_path, std::ios::trunc);
  if (!out) return report(rc, validation_error("cannot write " + out_path));
  out << cfg.dump(2) << "\n";
  if (!rc.json_out) std::cout << "Saved configuration of " << ip << " to " << out_path << "\n";
  return exit_code::kOk;
}

static int run_config_apply(RunCtx& rc, const std::string& target, const std::string& file,
                            bool save, std::size_t concurrency) {
  std::ifstream in(file);
  if (!in) return report(rc, validation_error("cannot read " + file));
  std::stringstream ss;
  ss << in.rdbuf();

  auto cfg = parse_device_config(ss.str());
  if (!cfg) return report(rc, validation_error(file + ": " + cfg.error().message));

  std::vector<std::string> cmds = params_to_commands(config_to_params(cfg.value()));
  if (save) cmds.push_back(commands::save_config());

  auto ips = resolve_targets(rc, target, "");
  if (!ips) return report(rc, ips.error());

  const auto timeout = rc.timeout();
  auto res = dispatch(ips.value(), concurrency,
      [&](AsyncContext& ctx, const std::string& ip) { return send_commands(ctx, ip, cmds, timeout); },
      rc.cancel);
  return print_batch(rc, res, [&](const BatchItem<std::vector<CommandResponse>>& it) {
    return std::to_string(it.result.value().size()) + " command(s) applied";
  });
}

// Progress lines for interactive OTA runs.
class ConsoleProgress : public ProgressHandler {
public:
  explicit ConsoleProgress(bool quiet) : quiet_(quiet) {}
  void on_progress(const std::string& ip, uint64_t sent, uint64_t total) override {
    if (quiet_) return;
    if (sent == 0) std::cout << ip << ": uploading " << total << " bytes\n";
  }
  void on_complete(const std::string& ip) override {
    if (!quiet_) std::cout << ip << ": done, device is rebooting\n";
  }
  void on_error(const std::string& ip, const std::string& message) override {
    if (!quiet_) std::cout << ip << ": " << message << "\n";
  }
private:
  bool quiet_;
};

static int run_ota(RunCtx& rc, const std::string& target, const std::string& firmware,
                   const std::string& role, std::size_t concurrency) {
  auto image = load_firmware(firmware);
  if (!image) return report(rc, image.error());

  auto ips = resolve_targets(rc, target, role);
  if (!ips) return report(rc, ips.error());

  ConsoleProgress progress(rc.json_out);
  auto res = upload_firmware_bulk(ips.value(), image.value().data, image.value().filename,
                                  concurrency, progress, make_http_upload_client, rc.cancel);
  return print_batch(rc, res, [](const BatchItem<void>&) { return std::string("uploaded"); });
}

static int run_logs(RunCtx& rc, const std::string& ip, const std::string& level,
                    const std::string& tag, uint16_t port) {
  LogFilter filter;
  if (!ip.empty())  filter.ip = ip;
  if (!tag.empty()) filter.tag_glob = tag;
  if (!level.empty()) {
    auto lvl = parse_log_level(level);
    if (!lvl) return invalid_args("unknown log level '" + level + "'");
    filter.min_level = *lvl;
  }

  LogReceiver rx(port);
  auto st = rx.run(filter, [&](const LogRecord& r) {
    if (rc.json_out) std::cout << json(r).dump() << std::endl;
    else             std::cout << format_log_line(r) << std::endl;
  }, rc.cancel);
  if (!st) return report(rc, st.error());
  return exit_code::kOk;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // Global options
  bool opt_json = false;
  bool opt_strict = false;
  bool opt_no_color = false;
  int  opt_verbose = 0;
  uint64_t opt_timeout = 0;
  std::string opt_settings;

  CLI::App app{"rtlslink: discover, configure and update RTLS-Link devices"};
  app.require_subcommand(1);
  app.fallthrough(true);

  app.add_flag("--json", opt_json, "Machine-readable JSON output");
  app.add_flag("--strict", opt_strict, "Exit 5 when a bulk operation partially fails");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("-v,--verbose", opt_verbose, "More log output on stderr (-v info, -vv debug)");
  auto* timeout_opt = app.add_option("--timeout", opt_timeout, "Command timeout in ms (env RTLS_CLI_TIMEOUT)");
  app.add_option("--settings", opt_settings, "Settings file (default ~/.config/rtlslink/settings.json)");

  // discover
  bool disc_watch = false;
  uint32_t disc_duration = 0;
  std::string disc_role;
  auto* discover_cmd = app.add_subcommand("discover", "Listen for device heartbeats");
  discover_cmd->add_flag("-w,--watch", disc_watch, "Keep listening and redraw on change");
  auto* disc_duration_opt = discover_cmd->add_option("-d,--duration", disc_duration, "Listen time in seconds");
  discover_cmd->add_option("--filter-role", disc_role, "Only show this role (anchor, tag, anchor_tdoa, tag_tdoa, calibration)");

  // status
  std::string status_target;
  bool status_health = false;
  auto* status_cmd = app.add_subcommand("status", "Show heartbeat telemetry for one device or all");
  status_cmd->add_option("target", status_target, "Device IP or 'all'")->required();
  status_cmd->add_flag("--health", status_health, "Evaluate device health");

  // cmd
  std::string cmd_ip;
  std::vector<std::string> cmd_words;
  std::size_t cmd_retries = 0;
  auto* cmd_cmd = app.add_subcommand("cmd", "Send one command to one device");
  cmd_cmd->add_option("ip", cmd_ip, "Device IP[:port]")->required();
  cmd_cmd->add_option("command", cmd_words, "Command text (quote it or put it after --)")->required();
  cmd_cmd->add_option("--retries", cmd_retries, "Extra attempts on failure");

  // bulk
  std::vector<std::string> bulk_words;
  std::string bulk_ips, bulk_role;
  std::size_t bulk_concurrency = 0;
  auto* bulk_cmd = app.add_subcommand("bulk", "Send one command to many devices");
  bulk_cmd->add_option("command", bulk_words, "Command text (quote it or put it after --)")->required();
  bulk_cmd->add_option("--ips", bulk_ips, "Comma-separated IPs (default: discover)");
  bulk_cmd->add_option("--filter-role", bulk_role, "Only discovered devices with this role");
  auto* bulk_conc_opt = bulk_cmd->add_option("-c,--concurrency", bulk_concurrency, "Devices in flight at once");

  // config
  auto* config_cmd = app.add_subcommand("config", "Read, write, back up or apply device configuration");
  config_cmd->require_subcommand(1);

  std::string cfg_ip, cfg_group, cfg_name, cfg_value, cfg_out, cfg_file, cfg_target;
  bool cfg_save = false;
  std::size_t cfg_concurrency = 0;

  auto* cfg_read = config_cmd->add_subcommand("read", "Dump parameters (readall)");
  cfg_read->add_option("ip", cfg_ip, "Device IP")->required();
  cfg_read->add_option("-g,--group", cfg_group, "Only this group (wifi, uwb, app)");

  auto* cfg_write = config_cmd->add_subcommand("write", "Write one parameter");
  cfg_write->add_option("ip", cfg_ip, "Device IP")->required();
  cfg_write->add_option("group", cfg_group, "Parameter group")->required();
  cfg_write->add_option("name", cfg_name, "Parameter name")->required();
  cfg_write->add_option("value", cfg_value, "New value")->required();
  cfg_write->add_flag("--save", cfg_save, "Persist with save-config afterwards");

  auto* cfg_backup = config_cmd->add_subcommand("backup", "Fetch the device configuration as JSON");
  cfg_backup->add_option("ip", cfg_ip, "Device IP")->required();
  cfg_backup->add_option("-o,--output", cfg_out, "Write to file instead of stdout");

  auto* cfg_apply = config_cmd->add_subcommand("apply", "Write a saved configuration (devShortAddr is kept)");
  cfg_apply->add_option("target", cfg_target, "Device IP, comma list, or 'all'")->required();
  cfg_apply->add_option("file", cfg_file, "Configuration JSON (backup-config format)")->required();
  cfg_apply->add_flag("--save", cfg_save, "Persist with save-config afterwards");
  auto* cfg_conc_opt = cfg_apply->add_option("-c,--concurrency", cfg_concurrency, "Devices in flight at once");

  // ota
  std::string ota_target, ota_file, ota_role;
  std::size_t ota_concurrency = 0;
  auto* ota_cmd = app.add_subcommand("ota", "Upload firmware");
  ota_cmd->add_option("target", ota_target, "Device IP, comma list, or 'all'")->required();
  ota_cmd->add_option("firmware", ota_file, "Firmware image (.bin)")->required();
  ota_cmd->add_option("--filter-role", ota_role, "With 'all': only this role");
  auto* ota_conc_opt = ota_cmd->add_option("-c,--concurrency", ota_concurrency, "Uploads in flight at once");

  // logs
  std::string logs_ip, logs_level, logs_tag;
  uint16_t logs_port = 0;
  auto* logs_cmd = app.add_subcommand("logs", "Stream device logs sent over UDP");
  logs_cmd->add_option("--ip", logs_ip, "Only this device");
  logs_cmd->add_option("--level", logs_level, "Minimum level (error, warn, info, debug, verbose)");
  logs_cmd->add_option("--tag", logs_tag, "Tag glob, e.g. 'uwb*'");
  auto* logs_port_opt = logs_cmd->add_option("--port", logs_port, "UDP port");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    int rc = app.exit(e);
    return rc == 0 ? exit_code::kOk : exit_code::kInvalidArg;
  }

  rtlslink::logging::init(opt_verbose);

  RunCtx rc;
  rc.json_out = opt_json;
  rc.strict = opt_strict;
  rc.ansi.enabled = !opt_no_color && !opt_json && is_tty_stdout();
  install_signal_handlers(rc.cancel);

  // defaults < file < env < flags
  fs::path settings_path = opt_settings.empty() ? default_settings_path() : fs::path(opt_settings);
  auto loaded = load_settings(settings_path);
  if (!loaded) return report(rc, loaded.error());
  rc.settings = loaded.value();
  apply_env_overrides(rc.settings);
  if (timeout_opt->count() > 0) rc.settings.timeout_ms = opt_timeout;
  if (disc_duration_opt->count() > 0) rc.settings.discovery_duration_s = disc_duration;
  if (logs_port_opt->count() > 0) rc.settings.log_port = logs_port;

  auto conc = [&](CLI::Option* o, std::size_t v) { return o->count() > 0 ? v : rc.settings.concurrency; };

  if (*discover_cmd) return run_discover(rc, disc_watch, disc_role);
  if (*status_cmd)   return run_status(rc, status_target, status_health);
  if (*cmd_cmd)      return run_cmd(rc, cmd_ip, join_words(cmd_words), cmd_retries);
  if (*bulk_cmd)     return run_bulk(rc, join_words(bulk_words), bulk_ips, bulk_role, conc(bulk_conc_opt, bulk_concurrency));
  if (*config_cmd) {
    if (*cfg_read)   return run_config_read(rc, cfg_ip, cfg_group);
    if (*cfg_write)  return run_config_write(rc, cfg_ip, cfg_group, cfg_name, cfg_value, cfg_save);
    if (*cfg_backup) return run_config_backup(rc, cfg_ip, cfg_out);
    if (*cfg_apply)  return run_config_apply(rc, cfg_target, cfg_file, cfg_save, conc(cfg_conc_opt, cfg_concurrency));
  }
  if (*ota_cmd)      return run_ota(rc, ota_target, ota_file, ota_role, conc(ota_conc_opt, ota_concurrency));
  if (*logs_cmd)     return run_logs(rc, logs_ip, logs_level, logs_tag, rc.settings.log_port);

  return invalid_args("no subcommand");
}
