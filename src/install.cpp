#include "install.h"

#include "extract.h"
#include "platform.h"
#include "release_locator.h"
#include "sha256.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <chrono>
#include <exception>
#include <filesystem>
#include <string>
#include <type_traits>
#include <utility>

namespace gdenv {

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start)
                                       .count());
}

// Runs fn inside a traced phase; foreign exceptions become install_error for that phase.
template <typename Fn>
std::invoke_result_t<Fn> run_phase(std::string const &version, install_phase phase, Fn &&fn) {
  phase_trace_scope const trace_scope{ version, phase, std::chrono::steady_clock::now() };
  try {
    return std::forward<Fn>(fn)();
  } catch (install_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw install_error(phase, e.what());
  }
}

std::string read_digest_sidecar(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  std::string digest{ bytes.begin(), bytes.end() };
  while (!digest.empty() && (digest.back() == '\n' || digest.back() == '\r' ||
                             digest.back() == ' ')) {
    digest.pop_back();
  }
  return digest;
}

bool check_cache(version_spec const &spec, store_paths const &p) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p.cached_archive_path, ec)) {
    GDENV_TRACE_CACHE_MISS(spec.canonical(), p.cached_archive_path.string());
    return false;
  }

  bool verified{ false };
  if (std::filesystem::is_regular_file(p.cached_digest_path, ec)) {
    // Read failures leave the cache alone; only a hash mismatch discards it.
    std::string expected;
    sha256_t actual{};
    try {
      expected = read_digest_sidecar(p.cached_digest_path);
      actual = sha256(p.cached_archive_path);
    } catch (std::runtime_error const &e) {
      throw install_error(install_phase::check_cache,
                          "Failed to read cached archive " + p.cached_archive_path.string() +
                              ": " + e.what());
    }

    try {
      sha256_verify(expected, actual);
    } catch (std::runtime_error const &e) {
      std::filesystem::remove(p.cached_archive_path);
      std::filesystem::remove(p.cached_digest_path);
      throw install_error(install_phase::check_cache,
                          "Cached archive " + p.cached_archive_path.string() +
                              " failed verification (" + e.what() +
                              ") and was removed. Re-run the install to download it again.");
    }
    verified = true;
  }

  GDENV_TRACE_CACHE_HIT(spec.canonical(), p.cached_archive_path.string(), verified);
  tui::info("Version %s is already downloaded. Extracting from cache.",
            spec.requested().c_str());
  return true;
}

std::vector<unsigned char> fetch_artifact(version_spec const &spec,
                                          release_artifact const &artifact,
                                          store_paths const &p,
                                          install_ctx &ctx) {
  tui::info("Package URL: %s", artifact.download_url.c_str());
  GDENV_TRACE_FETCH_FILE_START(spec.canonical(),
                               artifact.download_url,
                               p.cached_archive_path.string());

  auto const start{ std::chrono::steady_clock::now() };
  auto bytes{ transport_fetch(ctx.transport, artifact.download_url, ctx.download_headers) };

  if (artifact.sha256) {
    sha256_verify(*artifact.sha256, sha256(bytes.data(), bytes.size()));
    tui::debug("verified sha256 of %s", artifact.asset_name.c_str());
  } else {
    tui::debug("no published digest for %s; skipping verification",
               artifact.asset_name.c_str());
  }

  // Archive and sidecar land together or not at all
  util_write_file(p.cached_archive_path, bytes.data(), bytes.size());
  scoped_path_cleanup archive_guard{ p.cached_archive_path };
  if (artifact.sha256) {
    util_write_file(p.cached_digest_path, *artifact.sha256 + "\n");
  } else {
    std::filesystem::remove(p.cached_digest_path);
  }
  archive_guard.release();

  GDENV_TRACE_FETCH_FILE_COMPLETE(spec.canonical(),
                                  artifact.download_url,
                                  static_cast<std::int64_t>(bytes.size()),
                                  elapsed_ms(start));
  tui::info("Downloaded to: %s", p.cached_archive_path.string().c_str());
  return bytes;
}

std::uint64_t extract_to_staging(version_spec const &spec,
                                 store_paths const &p,
                                 std::vector<unsigned char> const *fetched) {
  if (std::filesystem::exists(p.partial_root_dir)) {
    tui::debug("removing stale staging directory %s", p.partial_root_dir.string().c_str());
    std::filesystem::remove_all(p.partial_root_dir);
  }

  GDENV_TRACE_EXTRACT_START(spec.canonical(),
                            fetched ? std::string{ "<memory>" }
                                    : p.cached_archive_path.string(),
                            p.partial_root_dir.string());
  auto const start{ std::chrono::steady_clock::now() };

  std::uint64_t files{ 0 };
  if (fetched) {
    files = extract(fetched->data(), fetched->size(), p.partial_root_dir);
  } else {
    try {
      files = extract(p.cached_archive_path, p.partial_root_dir);
    } catch (std::exception const &e) {
      throw install_error(install_phase::extract,
                          "Failed to extract cached archive " +
                              p.cached_archive_path.string() + ": " + e.what() +
                              ". Run 'gdenv cache rm " + spec.requested() +
                              "' and install again.");
    }
  }

  GDENV_TRACE_EXTRACT_COMPLETE(spec.canonical(),
                               static_cast<std::int64_t>(files),
                               elapsed_ms(start));
  return files;
}

void finalize_install(version_spec const &spec, store_paths const &p) {
  std::filesystem::path const marker{ p.partial_root_dir / kSelfContainedMarker };
  platform::touch_file(marker);
  GDENV_TRACE_FILE_TOUCHED(spec.canonical(), marker.string());

  // A directory without the binary is not an install; it is replaced wholesale
  if (std::filesystem::exists(p.installed_root_dir)) {
    tui::debug("replacing incomplete install directory %s",
               p.installed_root_dir.string().c_str());
    std::filesystem::remove_all(p.installed_root_dir);
  }

  platform::atomic_rename(p.partial_root_dir, p.installed_root_dir);
  platform::flush_directory(p.installed_root_dir.parent_path());

  std::error_code ec;
  if (!std::filesystem::is_regular_file(p.installed_binary_path, ec)) {
    tui::warn("Archive for %s did not contain %s",
              spec.requested().c_str(),
              p.binary_name.c_str());
  }
}

}  // namespace

install_error::install_error(install_phase phase, std::string const &message)
    : std::runtime_error{ std::string{ install_phase_name(phase) } + ": " + message },
      phase_{ phase } {}

install_result_t install(version_spec const &spec,
                         install_options const &options,
                         install_ctx &ctx) {
  store_paths const p{ ctx.st.paths(spec) };
  std::string const &version{ spec.canonical() };

  bool const already_installed{ run_phase(version, install_phase::check_installed, [&] {
    if (options.force) {
      if (uninstall(ctx.st, spec)) {
        tui::info("Removed previous install of %s", spec.requested().c_str());
      }
      return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(p.installed_binary_path, ec);
  }) };

  if (already_installed) {
    return install_outcome::already_installed{ .binary_path = p.installed_binary_path };
  }

  bool const cache_hit{ run_phase(version, install_phase::check_cache, [&] {
    return check_cache(spec, p);
  }) };

  std::vector<unsigned char> fetched;
  if (!cache_hit) {
    locate_result_t const located{ run_phase(version, install_phase::locate, [&] {
      return release_locate(ctx.index, version, p.archive_name);
    }) };

    if (auto const *nf{ std::get_if<release_not_found>(&located) }) {
      return install_outcome::version_not_found{ .tag_name = nf->tag_name };
    }
    if (auto const *pu{ std::get_if<platform_unsupported>(&located) }) {
      return install_outcome::platform_unsupported{ .tag_name = pu->tag_name,
                                                    .asset_name = pu->asset_name };
    }

    auto const &artifact{ std::get<release_artifact>(located) };
    fetched = run_phase(version, install_phase::fetch, [&] {
      return fetch_artifact(spec, artifact, p, ctx);
    });
  }

  scoped_path_cleanup staging_guard{ p.partial_root_dir };

  std::uint64_t const files{ run_phase(version, install_phase::extract, [&] {
    return extract_to_staging(spec, p, cache_hit ? nullptr : &fetched);
  }) };

  run_phase(version, install_phase::finalize, [&] { finalize_install(spec, p); });
  staging_guard.release();

  tui::info("Extracted to: %s", p.installed_root_dir.string().c_str());

  return install_outcome::installed{ .install_dir = p.installed_root_dir,
                                     .binary_path = p.installed_binary_path,
                                     .from_cache = cache_hit,
                                     .files_extracted = files };
}

bool uninstall(store const &st, version_spec const &spec) {
  return st.remove_installed(spec);
}

}  // namespace gdenv
