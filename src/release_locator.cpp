#include "release_locator.h"

#include "tui.h"

#include <algorithm>

namespace gdenv {

locate_result_t release_locate(release_index &index,
                               std::string_view canonical_tag,
                               std::string_view archive_name) {
  auto const record{ index.find_by_tag(canonical_tag) };
  if (!record) {
    tui::debug("release %.*s not found",
               static_cast<int>(canonical_tag.size()),
               canonical_tag.data());
    return release_not_found{ .tag_name = std::string{ canonical_tag } };
  }

  auto const it{ std::ranges::find(record->assets, archive_name, &release_asset::name) };
  if (it == record->assets.end()) {
    tui::debug("release %s has %zu assets, none named %.*s",
               record->tag_name.c_str(),
               record->assets.size(),
               static_cast<int>(archive_name.size()),
               archive_name.data());
    return platform_unsupported{ .tag_name = record->tag_name,
                                 .asset_name = std::string{ archive_name } };
  }

  return release_artifact{ .tag_name = record->tag_name,
                           .asset_name = it->name,
                           .download_url = it->download_url,
                           .sha256 = it->sha256 };
}

}  // namespace gdenv
