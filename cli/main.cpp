/**
 * @file main.cpp
 * @brief pixelbridge CLI: WebSocket server or one-shot command for a BLE pixel display.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11), merge with an optional JSON config file.
 *  - Pick exactly one mode: --server, or -c NAME [PARAMS...].
 *  - Hand off to run_server() / run_one_shot(); their return value is the exit code.
 *
 * Exit codes:
 *  0  success (one-shot) / clean shutdown (server)
 *  1  device unavailable, transport lost, or server could not listen
 *  2  usage error, bad config, or command rejected
 *
 * Examples:
 *  pixelbridge -a AA:BB:CC:DD:EE:FF -s -p 4444
 *  pixelbridge -a AA:BB:CC:DD:EE:FF -c set_pixel 3 4 color=ff0000
 *  pixelbridge --list-commands
 */

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "pixelbridge/bridge.hpp"
#include "pixelbridge/command_registry.hpp"
#include "pixelbridge/config.hpp"
#include "pixelbridge/log.hpp"

using namespace pixelbridge;

int main(int argc, char** argv) {
  CLI::App app{"pixelbridge - WebSocket/CLI bridge to a BLE pixel display"};

  // ---- mode ----
  bool server = false;
  std::vector<std::string> command;     // NAME [PARAMS...]
  bool list_commands = false;

  // ---- target / tuning (defaults come from BridgeConfig) ----
  BridgeConfig cfg;
  std::string config_path;
  std::string address, address_type, host, log_level_name;
  int port = cfg.port;
  int retries = cfg.retry.max_retries;
  long retry_delay_ms = (long)cfg.retry.retry_delay.count();
  long connect_timeout_ms = (long)cfg.connect_timeout.count();
  int max_recoveries = cfg.max_recoveries;
  bool verbose = false, quiet = false;

  auto* opt_server  = app.add_flag("-s,--server", server, "Run as WebSocket server");
  auto* opt_command = app.add_option("-c,--command", command,
                                     "Execute one command: NAME [PARAMS...] (key=value for named params)");
  opt_server->excludes(opt_command);
  app.add_flag("--list-commands", list_commands, "List supported commands and their parameters");

  auto* opt_addr    = app.add_option("-a,--address", address, "Bluetooth device address");
  auto* opt_atype   = app.add_option("--address-type", address_type, "public|random (default public)")
                         ->check(CLI::IsMember({"public", "random"}));
  auto* opt_port    = app.add_option("-p,--port", port, "WebSocket listen port (default 4444)")
                         ->check(CLI::Range(1, 65535));
  auto* opt_host    = app.add_option("--host", host, "WebSocket listen host (default localhost)");
  auto* opt_retries = app.add_option("--retries", retries, "BLE connect attempts per acquisition (default 5)");
  auto* opt_delay   = app.add_option("--retry-delay-ms", retry_delay_ms, "Delay between connect attempts (default 5000)");
  auto* opt_ctmo    = app.add_option("--connect-timeout-ms", connect_timeout_ms, "Per-attempt BLE connect timeout (default 10000)");
  auto* opt_recov   = app.add_option("--max-recoveries", max_recoveries,
                                     "Consecutive reconnects allowed per client after link loss (default 3)");
  app.add_option("--config", config_path, "JSON config file");
  auto* opt_level   = app.add_option("--log-level", log_level_name, "debug|info|warn|error")
                         ->check(CLI::IsMember({"debug", "info", "warn", "error"}));
  app.add_flag("-v,--verbose", verbose, "Same as --log-level debug");
  app.add_flag("-q,--quiet", quiet, "Same as --log-level error");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  RunMode mode = RunMode::Server;
  std::string err;
  if (!select_mode(server, list_commands, command, mode, err)) {
    std::cerr << "status=error reason=" << err
              << " hint=\"use --server or -c NAME [PARAMS...] with -a ADDRESS\"\n";
    return 2;
  }

  // -------- list mode: no device needed --------
  if (mode == RunMode::ListCommands) {
    const CommandRegistry registry = make_pixel_registry();
    for (const auto& spec : registry.commands())
      std::cout << describe(spec) << "\n";
    return 0;
  }

  // -------- config: defaults <- file <- explicit options --------
  ConfigOverrides o;
  if (opt_addr->count())    o.address = address;
  if (opt_atype->count())   o.address_type = address_type;
  if (opt_port->count())    o.port = port;
  if (opt_host->count())    o.host = host;
  if (opt_retries->count()) o.max_retries = retries;
  if (opt_delay->count())   o.retry_delay_ms = retry_delay_ms;
  if (opt_ctmo->count())    o.connect_timeout_ms = connect_timeout_ms;
  if (opt_recov->count())   o.max_recoveries = max_recoveries;
  if (opt_level->count())   o.log_level = log_level_name;
  o.verbose = verbose;
  o.quiet = quiet;

  if (!resolve_config(config_path, o, cfg, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 2;
  }
  set_log_level(cfg.log_level);

  try {
    const CommandRegistry registry = make_pixel_registry();

    if (mode == RunMode::Server)
      return run_server(cfg, registry, std::cout);

    const std::string name = command.front();
    const std::vector<std::string> params(command.begin() + 1, command.end());
    return run_one_shot(cfg, registry, name, params, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "status=error reason=fatal what=\"" << e.what() << "\"\n";
    return 1;
  }
}
