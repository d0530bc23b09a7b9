#pragma once

#include "cmd.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace gdenv {

class cmd_install : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_install> {
    std::string version;
    bool force{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_install(cfg cfg, cli_roots const &roots);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_roots roots_;
};

}  // namespace gdenv
