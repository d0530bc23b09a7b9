#pragma once

#include "cmd.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace gdenv {

// Starts the project manager of an installed version.
class cmd_launch : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_launch> {
    std::string version;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_launch(cfg cfg, cli_roots const &roots);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_roots roots_;
};

// Opens the project in the current directory with an installed version.
class cmd_edit : public cmd {
 public:
  static constexpr char const *kProjectFileName{ "project.godot" };

  struct cfg : cmd_cfg<cmd_edit> {
    std::string version;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_edit(cfg cfg, cli_roots const &roots);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_roots roots_;
};

}  // namespace gdenv
