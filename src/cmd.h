#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace gdenv {

// Root overrides given as global command-line options.
struct cli_roots {
  std::optional<std::filesystem::path> data_root;
  std::optional<std::filesystem::path> cache_root;
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // Returns false after reporting an expected failure (not found, not installed).
  // Unexpected failures throw.
  virtual bool execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, cli_roots const &roots);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, cli_roots const &roots) {
  return std::make_unique<typename config::cmd_t>(cfg, roots);
}

}  // namespace gdenv
