#pragma once

#include "platform.h"
#include "store.h"
#include "version_spec.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <variant>

namespace gdenv {

enum class launch_mode {
  project_manager,  // --project-manager, streams to the null device
  editor,           // --editor --path <project>, streams inherited
};

struct launch_options {
  launch_mode mode{ launch_mode::project_manager };
  std::optional<std::filesystem::path> project_dir;  // required for editor mode
};

namespace launch_outcome {

struct launched {
  std::filesystem::path binary_path;
  std::int64_t pid;
};

struct not_installed {
  std::filesystem::path expected_binary_path;
};

}  // namespace launch_outcome

using launch_result_t = std::variant<launch_outcome::launched, launch_outcome::not_installed>;

using spawn_fn_t = std::function<std::int64_t(std::filesystem::path const &,
                                              platform::spawn_options const &)>;

// Start the installed binary for spec as a detached child and return without waiting.
// Spawn failures throw std::system_error.
launch_result_t launch(store const &st,
                       version_spec const &spec,
                       launch_options const &options,
                       spawn_fn_t const &spawn = platform::spawn_detached);

}  // namespace gdenv
