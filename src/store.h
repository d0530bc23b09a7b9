#pragma once

#include "engine_platform.h"
#include "store_layout.h"
#include "util.h"
#include "version_spec.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gdenv {

enum class installation_state {
  not_installed,  // neither binary nor archive
  installed,      // binary is a regular file
  cached_only,    // archive present, binary absent
};

std::string_view installation_state_name(installation_state state);

// Filesystem view of the data and cache roots. Holds no state besides the roots;
// everything is re-derived from disk on each call.
class store : unmovable {
 public:
  using path = std::filesystem::path;

  store(path data_root,
        path cache_root,
        engine_platform platform,
        std::string product_name = std::string{ kDefaultProductName });

  path const &data_root() const { return data_root_; }
  path const &cache_root() const { return cache_root_; }
  engine_platform platform() const { return platform_; }
  std::string const &product_name() const { return product_name_; }

  store_paths paths(version_spec const &spec) const;
  installation_state state(version_spec const &spec) const;

  struct installed_entry {
    std::string canonical;
    path binary_path;
  };

  // Canonical tags whose binary exists for this platform, newest first.
  std::vector<installed_entry> list_installed() const;

  struct cached_entry {
    std::string canonical;
    path archive_path;
    std::uint64_t size_bytes;
  };

  // Every cached archive for this platform, newest first.
  std::vector<cached_entry> list_cached() const;

  // Removes <cache>/engines/<canonical>. Returns false if nothing was there.
  bool remove_cached(version_spec const &spec) const;

  // Removes every <cache>/engines/* entry; returns the number removed.
  std::size_t remove_all_cached() const;

  // Removes the installed root directory (never the cache). Returns whether anything
  // was removed.
  bool remove_installed(version_spec const &spec) const;

 private:
  path data_root_;
  path cache_root_;
  engine_platform platform_;
  std::string product_name_;
};

}  // namespace gdenv
