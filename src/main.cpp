#include <CLI11.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "config_manager.hpp"
#include "gate_config.hpp"
#include "gate_error.hpp"
#include "gate_runner.hpp"
#include "session_context.hpp"

#ifndef URGATE_DEFAULT_CONFIG
#define URGATE_DEFAULT_CONFIG "/etc/ur-rsync-gate/ur-rsync-gate.json"
#endif

static std::optional<std::string> read_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

int main(int argc, char **argv) {
  CLI::App app{"ur-rsync-gate - restricted rsync server for forced SSH commands"};

  bool verbose = false;
  std::string config_path = URGATE_DEFAULT_CONFIG;
  urgate::SessionOptions options;

  auto *ro = app.add_flag("--ro", options.read_only,
                          "Allow only sending data from the restricted root");
  auto *wo = app.add_flag("--wo", options.write_only,
                          "Allow only receiving data into the restricted root");
  ro->excludes(wo);
  app.add_flag("--munge", options.munge_links,
               "Force --munge-links on the transfer tool");
  app.add_flag("--no-del", options.no_delete,
               "Refuse delete and remove options");
  app.add_flag("--no-lock", options.no_lock,
               "Do not serialize sessions on the restricted root");
  app.add_flag("--escalate", options.escalate,
               "Run the transfer tool through sudo or doas");
  app.add_option("--config", config_path, "Gate configuration JSON file");
  app.add_flag("-v,--verbose", verbose, "Trace decisions on stderr");
  app.add_option("root", options.restricted_root, "Restricted root directory")
      ->required();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  urgate::ConfigManager config_manager(verbose);
  urgate::GateConfig config; // defaults until the file is read

  try {
    if (!config_manager.load_config(config_path)) {
      throw urgate::GateError(urgate::GateErrorCode::ConfigError,
                              "cannot load configuration " + config_path);
    }
    config = config_manager.gate_config();
    urgate::SessionContext session =
        urgate::SessionContext::resolve(options, verbose);

    urgate::GateRunner runner(session, config, verbose);
    return runner.run(read_env(config.command_env),
                      read_env(config.connection_env));
  } catch (const urgate::GateError &e) {
    std::cerr << "[Main] " << e.what() << std::endl;
    return urgate::GateRunner::report_startup_failure(
        config, options, e, read_env(config.connection_env), verbose);
  }
}
