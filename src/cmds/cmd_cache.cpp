#include "cmd_cache.h"

#include "cmd_common.h"
#include "store_layout.h"
#include "tui.h"
#include "util.h"
#include "version_spec.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace gdenv {

void cmd_cache::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "cache",
      "Show or remove downloaded engine versions. Shows the cache by default") };
  sub->require_subcommand(0, 1);
  auto cfg_ptr{ std::make_shared<cfg>() };

  sub->add_subcommand("show", "Show downloaded engine versions in the cache");

  auto *rm{ sub->add_subcommand("rm", "Remove downloaded engine versions from the cache") };
  rm->add_flag("-a,--all", cfg_ptr->all, "Remove all downloaded engine versions");
  rm->add_option("versions",
                 cfg_ptr->versions,
                 "Which downloaded versions to remove, e.g. \"3.5.1 4.0.3\"");

  sub->callback([cfg_ptr, rm, on_selected = std::move(on_selected)] {
    cfg_ptr->act = rm->parsed() ? action::rm : action::show;
    on_selected(*cfg_ptr);
  });
}

cmd_cache::cmd_cache(cfg cfg, cli_roots const &roots)
    : cfg_{ std::move(cfg) }, roots_{ roots } {}

bool cmd_cache::execute() {
  switch (cfg_.act) {
    case action::show: return show();
    case action::rm: return remove();
  }
  return false;
}

bool cmd_cache::show() const {
  auto const st{ open_store(roots_) };
  auto const entries{ st->list_cached() };
  if (entries.empty()) {
    tui::info("Cache is empty");
    return true;
  }

  for (auto const &entry : entries) {
    tui::print_stdout("%-24s %10s  %s\n",
                      entry.canonical.c_str(),
                      util_format_bytes(entry.size_bytes).c_str(),
                      entry.archive_path.string().c_str());
  }

  auto const total{ util_directory_size(st->cache_root() / kEnginesDirName) };
  tui::info("Total cache size: %s", util_format_bytes(total).c_str());
  return true;
}

bool cmd_cache::remove() const {
  if (cfg_.all && !cfg_.versions.empty()) {
    tui::error("Pass either --all or a list of versions, not both");
    return false;
  }

  if (!cfg_.all && cfg_.versions.empty()) {
    tui::error("Nothing to remove. Pass versions to remove or --all");
    return false;
  }

  auto const st{ open_store(roots_) };

  if (cfg_.all) {
    auto const removed{ st->remove_all_cached() };
    tui::info("Removed %zu cached version(s)", removed);
    return true;
  }

  bool all_found{ true };
  for (auto const &version : cfg_.versions) {
    auto const spec{ version_spec::from(version) };
    if (st->remove_cached(spec)) {
      tui::info("Removed version %s from the cache", spec.requested().c_str());
    } else {
      tui::warn("Version %s is not in the cache", spec.requested().c_str());
      all_found = false;
    }
  }
  return all_found;
}

}  // namespace gdenv
