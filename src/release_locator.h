#pragma once

#include "release_index.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gdenv {

struct release_artifact {
  std::string tag_name;
  std::string asset_name;
  std::string download_url;
  std::optional<std::string> sha256;
};

struct release_not_found {
  std::string tag_name;
};

struct platform_unsupported {
  std::string tag_name;
  std::string asset_name;
};

using locate_result_t = std::variant<release_artifact, release_not_found, platform_unsupported>;

// Resolve canonical tag + archive name to a downloadable artifact. Index failures
// propagate as exceptions and never become release_not_found.
locate_result_t release_locate(release_index &index,
                               std::string_view canonical_tag,
                               std::string_view archive_name);

}  // namespace gdenv
