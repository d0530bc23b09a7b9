#include "cmd_list.h"

#include "cmd_common.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace gdenv {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "list",
      "List Godot engine versions. Shows installed versions by default") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_flag("-a,--available",
                cfg_ptr->available,
                "Show all Godot engine versions available on GitHub");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_list::cmd_list(cfg cfg, cli_roots const &roots)
    : cfg_{ std::move(cfg) }, roots_{ roots } {}

bool cmd_list::execute() {
  if (cfg_.available) {
    release_client client;
    for (auto const &tag : client.index().list_tags()) {
      tui::print_stdout("%s\n", tag.c_str());
    }
    return true;
  }

  auto const st{ open_store(roots_) };
  auto const installed{ st->list_installed() };
  if (installed.empty()) {
    tui::info("No versions installed");
    return true;
  }

  for (auto const &entry : installed) {
    tui::print_stdout("%s\n", entry.canonical.c_str());
  }
  return true;
}

}  // namespace gdenv
