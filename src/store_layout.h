#pragma once

#include "engine_platform.h"
#include "version_spec.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace gdenv {

inline constexpr std::string_view kDefaultProductName{ "Godot" };
inline constexpr std::string_view kArchiveExtension{ "zip" };
inline constexpr std::string_view kSelfContainedMarker{ "_sc_" };
inline constexpr std::string_view kEnginesDirName{ "engines" };

// On-disk locations for one (version, platform). Pure path arithmetic, no I/O.
struct store_paths {
  std::string binary_name;   // "<product>_v<canonical>_<suffix>"
  std::string archive_name;  // binary_name + ".zip"

  std::filesystem::path installed_root_dir;     // <data>/engines/<canonical>
  std::filesystem::path installed_binary_path;  // installed_root_dir / binary_name
  std::filesystem::path partial_root_dir;       // <data>/engines/.<canonical>.partial

  std::filesystem::path cached_archive_dir;   // <cache>/engines/<canonical>
  std::filesystem::path cached_archive_path;  // cached_archive_dir / archive_name
  std::filesystem::path cached_digest_path;   // cached_archive_path + ".sha256"
};

std::string store_binary_name(version_spec const &spec,
                              engine_platform platform,
                              std::string_view product_name = kDefaultProductName);

store_paths store_layout_paths(version_spec const &spec,
                               engine_platform platform,
                               std::filesystem::path const &data_root,
                               std::filesystem::path const &cache_root,
                               std::string_view product_name = kDefaultProductName);

}  // namespace gdenv
