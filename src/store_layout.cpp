#include "store_layout.h"

namespace gdenv {

std::string store_binary_name(version_spec const &spec,
                              engine_platform platform,
                              std::string_view product_name) {
  std::string name{ product_name };
  name.append("_v");
  name.append(spec.canonical());
  name.push_back('_');
  name.append(engine_platform_suffix(platform));
  return name;
}

store_paths store_layout_paths(version_spec const &spec,
                               engine_platform platform,
                               std::filesystem::path const &data_root,
                               std::filesystem::path const &cache_root,
                               std::string_view product_name) {
  store_paths p;
  p.binary_name = store_binary_name(spec, platform, product_name);
  p.archive_name = p.binary_name + "." + std::string{ kArchiveExtension };

  std::filesystem::path const engines_dir{ data_root / kEnginesDirName };
  p.installed_root_dir = engines_dir / spec.canonical();
  p.installed_binary_path = p.installed_root_dir / p.binary_name;
  p.partial_root_dir = engines_dir / ("." + spec.canonical() + ".partial");

  p.cached_archive_dir = cache_root / kEnginesDirName / spec.canonical();
  p.cached_archive_path = p.cached_archive_dir / p.archive_name;
  p.cached_digest_path = p.cached_archive_dir / (p.archive_name + ".sha256");
  return p;
}

}  // namespace gdenv
