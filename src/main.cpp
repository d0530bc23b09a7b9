#include "cli.h"
#include "install.h"
#include "tui.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  gdenv::tui::init();

  auto args{ gdenv::cli_parse(argc, argv) };
  try {
    gdenv::tui::configure_trace_outputs(args.trace_outputs);
  } catch (std::exception const &ex) {
    std::fprintf(stderr, "%s\n", ex.what());
    return EXIT_FAILURE;
  }
  gdenv::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      gdenv::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    gdenv::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return gdenv::cmd::create(cfg, args.roots); },
      *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (gdenv::install_error const &ex) {
    gdenv::tui::error("Install failed during %s", ex.what());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    gdenv::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
