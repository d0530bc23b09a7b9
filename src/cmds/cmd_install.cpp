#include "cmd_install.h"

#include "cmd_common.h"
#include "install.h"
#include "tui.h"
#include "version_spec.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>
#include <variant>

namespace gdenv {

void cmd_install::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("install", "Install the given Godot engine version") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("version", cfg_ptr->version, "Which version to install, e.g. \"3.5.1\"")
      ->required();
  sub->add_flag("-f,--force", cfg_ptr->force, "Re-install if already installed");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_install::cmd_install(cfg cfg, cli_roots const &roots)
    : cfg_{ std::move(cfg) }, roots_{ roots } {}

bool cmd_install::execute() {
  auto const spec{ version_spec::from(cfg_.version) };

  release_client client;
  auto const st{ open_store(roots_, client.cfg().product_name) };

  install_ctx ctx{ .st = *st,
                   .index = client.index(),
                   .transport = client.transport(),
                   .download_headers = {} };

  auto const result{ install(spec, install_options{ .force = cfg_.force }, ctx) };

  return std::visit(
      match{
          [](install_outcome::installed const &) { return true; },
          [&](install_outcome::already_installed const &) {
            tui::info("Version %s is already installed. Pass --force to re-install.",
                      spec.requested().c_str());
            return true;
          },
          [&](install_outcome::version_not_found const &) {
            tui::error("Sorry, version \"%s\" not found.", spec.requested().c_str());
            return false;
          },
          [&](install_outcome::platform_unsupported const &) {
            tui::error("Sorry, version \"%s\" does not support your platform.",
                       spec.requested().c_str());
            return false;
          },
      },
      result);
}

}  // namespace gdenv
