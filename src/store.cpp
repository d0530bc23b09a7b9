#include "store.h"

#include "platform.h"
#include "version.h"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace gdenv {

namespace {

void sort_newest_first(auto &entries) {
  std::sort(entries.begin(), entries.end(), [](auto const &a, auto const &b) {
    return version_is_newer(a.canonical, b.canonical);
  });
}

// Subdirectories of <root>/engines, skipping dot-prefixed staging directories.
std::vector<std::filesystem::path> engine_dirs(std::filesystem::path const &root) {
  std::vector<std::filesystem::path> dirs;
  std::filesystem::path const engines{ root / kEnginesDirName };

  std::error_code ec;
  if (!std::filesystem::is_directory(engines, ec)) { return dirs; }

  for (auto const &entry : std::filesystem::directory_iterator{ engines }) {
    if (!entry.is_directory()) { continue; }
    std::string const name{ entry.path().filename().string() };
    if (name.empty() || name.front() == '.') { continue; }
    dirs.push_back(entry.path());
  }
  return dirs;
}

}  // namespace

std::string_view installation_state_name(installation_state state) {
  switch (state) {
    case installation_state::not_installed: return "not_installed";
    case installation_state::installed: return "installed";
    case installation_state::cached_only: return "cached_only";
  }
  GDENV_UNREACHABLE();
}

store::store(path data_root,
             path cache_root,
             engine_platform platform,
             std::string product_name)
    : data_root_{ std::move(data_root) },
      cache_root_{ std::move(cache_root) },
      platform_{ platform },
      product_name_{ std::move(product_name) } {}

store_paths store::paths(version_spec const &spec) const {
  return store_layout_paths(spec, platform_, data_root_, cache_root_, product_name_);
}

installation_state store::state(version_spec const &spec) const {
  store_paths const p{ paths(spec) };

  std::error_code ec;
  if (std::filesystem::is_regular_file(p.installed_binary_path, ec)) {
    return installation_state::installed;
  }
  if (std::filesystem::is_regular_file(p.cached_archive_path, ec)) {
    return installation_state::cached_only;
  }
  return installation_state::not_installed;
}

std::vector<store::installed_entry> store::list_installed() const {
  std::vector<installed_entry> result;

  for (auto const &dir : engine_dirs(data_root_)) {
    std::string canonical{ dir.filename().string() };
    std::string_view const requested{ version_spec_requested_from_canonical(canonical) };
    if (requested.empty()) { continue; }

    // Skip directories that could never have been produced by an install
    std::optional<version_spec> spec;
    try {
      spec = version_spec::from(requested);
    } catch (std::invalid_argument const &) {
      continue;
    }

    store_paths const p{ paths(*spec) };
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p.installed_binary_path, ec)) { continue; }

    result.push_back({ .canonical = std::move(canonical),
                       .binary_path = p.installed_binary_path });
  }

  sort_newest_first(result);
  return result;
}

std::vector<store::cached_entry> store::list_cached() const {
  std::vector<cached_entry> result;

  for (auto const &dir : engine_dirs(cache_root_)) {
    for (auto const &entry : std::filesystem::directory_iterator{ dir }) {
      if (!entry.is_regular_file()) { continue; }
      if (entry.path().extension() != "." + std::string{ kArchiveExtension }) { continue; }

      result.push_back({ .canonical = dir.filename().string(),
                         .archive_path = entry.path(),
                         .size_bytes = static_cast<std::uint64_t>(entry.file_size()) });
    }
  }

  sort_newest_first(result);
  return result;
}

bool store::remove_cached(version_spec const &spec) const {
  path const dir{ paths(spec).cached_archive_dir };
  if (!std::filesystem::exists(dir)) { return false; }
  return std::filesystem::remove_all(dir) > 0;
}

std::size_t store::remove_all_cached() const {
  std::size_t removed{ 0 };
  for (auto const &dir : engine_dirs(cache_root_)) {
    std::filesystem::remove_all(dir);
    ++removed;
  }
  return removed;
}

bool store::remove_installed(version_spec const &spec) const {
  path const dir{ paths(spec).installed_root_dir };
  if (!std::filesystem::is_directory(dir)) { return false; }
  return std::filesystem::remove_all(dir) > 0;
}

}  // namespace gdenv
