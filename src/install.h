#pragma once

#include "install_phase.h"
#include "release_index.h"
#include "store.h"
#include "transport.h"
#include "version_spec.h"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace gdenv {

struct install_options {
  bool force{ false };  // uninstall first instead of short-circuiting
};

// External collaborators of the pipeline. References must outlive the call.
struct install_ctx {
  store const &st;
  release_index &index;
  byte_transport &transport;
  std::vector<std::string> download_headers;
};

namespace install_outcome {

struct installed {
  std::filesystem::path install_dir;
  std::filesystem::path binary_path;
  bool from_cache;
  std::uint64_t files_extracted;
};

struct already_installed {
  std::filesystem::path binary_path;
};

struct version_not_found {
  std::string tag_name;
};

struct platform_unsupported {
  std::string tag_name;
  std::string asset_name;
};

}  // namespace install_outcome

using install_result_t = std::variant<install_outcome::installed,
                                      install_outcome::already_installed,
                                      install_outcome::version_not_found,
                                      install_outcome::platform_unsupported>;

// I/O or transport failure in a named phase. The message carries the phase and the
// underlying cause.
class install_error : public std::runtime_error {
 public:
  install_error(install_phase phase, std::string const &message);

  install_phase phase() const { return phase_; }

 private:
  install_phase phase_;
};

// check_installed -> check_cache -> locate -> fetch -> extract -> finalize. Nothing is
// written before locate succeeds unless force removes a previous install. The
// installed directory appears atomically; an interrupted run leaves at most a cached
// archive and a stale staging directory, which the next run removes.
install_result_t install(version_spec const &spec,
                         install_options const &options,
                         install_ctx &ctx);

// Removes the installed directory for spec, never the cache. Returns whether anything
// was removed.
bool uninstall(store const &st, version_spec const &spec);

}  // namespace gdenv
