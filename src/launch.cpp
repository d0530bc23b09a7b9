#include "launch.h"

#include "trace.h"
#include "tui.h"

#include <stdexcept>
#include <string>

namespace gdenv {

launch_result_t launch(store const &st,
                       version_spec const &spec,
                       launch_options const &options,
                       spawn_fn_t const &spawn) {
  store_paths const p{ st.paths(spec) };

  std::error_code ec;
  if (!std::filesystem::is_regular_file(p.installed_binary_path, ec)) {
    return launch_outcome::not_installed{ .expected_binary_path = p.installed_binary_path };
  }

  platform::spawn_options spawn_opts;
  switch (options.mode) {
    case launch_mode::project_manager:
      spawn_opts.args = { "--project-manager" };
      spawn_opts.detach_stdio = true;
      break;
    case launch_mode::editor:
      if (!options.project_dir) {
        throw std::invalid_argument("launch: editor mode requires a project directory");
      }
      spawn_opts.args = { "--editor", "--path", options.project_dir->string() };
      spawn_opts.cwd = options.project_dir;
      spawn_opts.detach_stdio = false;
      break;
  }

  tui::info("Running: %s", p.installed_binary_path.string().c_str());
  if (!spawn_opts.detach_stdio) { tui::flush(); }

  std::int64_t const pid{ spawn(p.installed_binary_path, spawn_opts) };
  GDENV_TRACE_PROCESS_SPAWNED(p.installed_binary_path.string(),
                              pid,
                              spawn_opts.detach_stdio);
  tui::debug("spawned pid %lld", static_cast<long long>(pid));

  return launch_outcome::launched{ .binary_path = p.installed_binary_path, .pid = pid };
}

}  // namespace gdenv
