#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace gdenv {

class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {
    bool available{ false };  // release tags from the index instead of installs
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_list(cfg cfg, cli_roots const &roots);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_roots roots_;
};

}  // namespace gdenv
