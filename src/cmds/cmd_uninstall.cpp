#include "cmd_uninstall.h"

#include "cmd_common.h"
#include "install.h"
#include "tui.h"
#include "version_spec.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace gdenv {

void cmd_uninstall::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("uninstall", "Uninstall the given Godot engine version") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("version", cfg_ptr->version, "Which version to uninstall, e.g. \"3.5.1\"")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_uninstall::cmd_uninstall(cfg cfg, cli_roots const &roots)
    : cfg_{ std::move(cfg) }, roots_{ roots } {}

// Removing a version that is not installed leaves the store as requested, so it is
// reported but not treated as a failure.
bool cmd_uninstall::execute() {
  auto const spec{ version_spec::from(cfg_.version) };
  auto const st{ open_store(roots_) };

  if (uninstall(*st, spec)) {
    tui::info("Uninstalled version %s", spec.requested().c_str());
  } else {
    tui::info("Version %s is not installed", spec.requested().c_str());
  }
  return true;
}

}  // namespace gdenv
