#pragma once

#include "cmd.h"

#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace gdenv {

// Shows or removes downloaded engine archives. `cache` alone shows.
class cmd_cache : public cmd {
 public:
  enum class action { show, rm };

  struct cfg : cmd_cfg<cmd_cache> {
    action act{ action::show };
    bool all{ false };
    std::vector<std::string> versions;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_cache(cfg cfg, cli_roots const &roots);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  bool show() const;
  bool remove() const;

  cfg cfg_;
  cli_roots roots_;
};

}  // namespace gdenv
