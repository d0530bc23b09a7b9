#include "cmd_launch.h"

#include "cmd_common.h"
#include "launch.h"
#include "tui.h"
#include "version_spec.h"

#include "CLI11.hpp"

#include <filesystem>
#include <memory>
#include <utility>
#include <variant>

namespace gdenv {

namespace {

bool report_launch(version_spec const &spec, launch_result_t const &result) {
  return std::visit(match{
                        [](launch_outcome::launched const &) { return true; },
                        [&](launch_outcome::not_installed const &) {
                          tui::error("Version %s is not installed.",
                                     spec.requested().c_str());
                          return false;
                        },
                    },
                    result);
}

}  // namespace

void cmd_launch::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("launch", "Launch the given Godot engine version") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("version", cfg_ptr->version, "Which version to launch, e.g. \"3.5.1\"")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_launch::cmd_launch(cfg cfg, cli_roots const &roots)
    : cfg_{ std::move(cfg) }, roots_{ roots } {}

bool cmd_launch::execute() {
  auto const spec{ version_spec::from(cfg_.version) };
  auto const st{ open_store(roots_) };
  return report_launch(spec,
                       launch(*st, spec, launch_options{ .mode = launch_mode::project_manager }));
}

void cmd_edit::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "edit",
      "Edit the Godot project in the current directory with the given version") };
  sub->alias("open");
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("version", cfg_ptr->version, "Which version to edit with, e.g. \"4.2\"")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_edit::cmd_edit(cfg cfg, cli_roots const &roots)
    : cfg_{ std::move(cfg) }, roots_{ roots } {}

bool cmd_edit::execute() {
  auto const spec{ version_spec::from(cfg_.version) };

  std::filesystem::path const project_dir{ std::filesystem::current_path() };
  std::error_code ec;
  if (!std::filesystem::is_regular_file(project_dir / kProjectFileName, ec)) {
    tui::error("No %s found in %s", kProjectFileName, project_dir.string().c_str());
    return false;
  }

  auto const st{ open_store(roots_) };
  return report_launch(spec,
                       launch(*st,
                              spec,
                              launch_options{ .mode = launch_mode::editor,
                                              .project_dir = project_dir }));
}

}  // namespace gdenv
