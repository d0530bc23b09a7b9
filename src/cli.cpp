#include "cli.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gdenv {

namespace {

// "stderr,file:/tmp/t.jsonl" -> outputs; an empty spec means stderr.
std::variant<std::vector<tui::trace_output_spec>, std::string> parse_trace_outputs(
    std::string_view spec) {
  if (spec.empty()) { spec = "stderr"; }

  std::vector<tui::trace_output_spec> outputs;
  while (!spec.empty()) {
    auto const comma{ spec.find(',') };
    auto const token{ spec.substr(0, comma) };
    spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
    if (token.empty()) { continue; }

    if (token == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (token.starts_with("file:") && token.size() > 5) {
      outputs.push_back(
          { tui::trace_output_type::file, std::filesystem::path{ token.substr(5) } });
    } else {
      return "Invalid trace output spec: " + std::string{ token };
    }
  }
  return outputs;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "gdenv - Godot engine version manager" };
  // "/path" arguments are positionals, not Windows-style options.
  app.allow_windows_style_options(false);
  // Global options are accepted after the subcommand too.
  app.fallthrough();

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  cli_args args{};
  app.add_option("--data-root",
                 args.roots.data_root,
                 "Directory holding installed engines (default: GDENV_DATA_ROOT or "
                 "the per-user data directory)");
  app.add_option("--cache-root",
                 args.roots.cache_root,
                 "Directory holding downloaded archives (default: GDENV_CACHE_ROOT or "
                 "the per-user cache directory)");

  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_list::register_cli(app, on_selected);
  cmd_install::register_cli(app, on_selected);
  cmd_uninstall::register_cli(app, on_selected);
  cmd_launch::register_cli(app, on_selected);
  cmd_edit::register_cli(app, on_selected);
  cmd_cache::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (trace_option->count() > 0) {
    auto parsed{ parse_trace_outputs(trace_spec) };
    if (auto *outputs{ std::get_if<std::vector<tui::trace_output_spec>>(&parsed) }) {
      args.trace_outputs = std::move(*outputs);
    } else {
      args.cli_output = std::move(std::get<std::string>(parsed));
      cmd_cfg.reset();
    }
  }

  if (!args.trace_outputs.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if ((version_flag_short || version_flag_long) && args.cli_output.empty()) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace gdenv
