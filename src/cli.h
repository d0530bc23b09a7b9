#pragma once

#include "cmd.h"
#include "cmds/cmd_cache.h"
#include "cmds/cmd_install.h"
#include "cmds/cmd_launch.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_uninstall.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gdenv {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_cache::cfg,
                                 cmd_edit::cfg,
                                 cmd_install::cfg,
                                 cmd_launch::cfg,
                                 cmd_list::cfg,
                                 cmd_uninstall::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cli_roots roots;  // global --data-root / --cache-root overrides
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace gdenv
