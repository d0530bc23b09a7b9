#include "store_layout.h"

#include "doctest.h"

namespace gdenv {

TEST_CASE("store_layout: binary name per platform") {
  auto const spec{ version_spec::from("3.5.1") };
  CHECK(store_binary_name(spec, engine_platform::linux64) == "Godot_v3.5.1-stable_x11.64");
  CHECK(store_binary_name(spec, engine_platform::windows64) ==
        "Godot_v3.5.1-stable_win64.exe");
  CHECK(store_binary_name(spec, engine_platform::macos) ==
        "Godot_v3.5.1-stable_osx.universal");
  CHECK(store_binary_name(spec, engine_platform::unsupported) ==
        "Godot_v3.5.1-stable_unsupported");
  CHECK(store_binary_name(spec, engine_platform::linux32, "Engine") ==
        "Engine_v3.5.1-stable_x11.32");
}

TEST_CASE("store_layout: paths under data and cache roots") {
  std::filesystem::path const data{ "/data" };
  std::filesystem::path const cache{ "/cache" };
  auto const p{
    store_layout_paths(version_spec::from("3.5.1"), engine_platform::linux64, data, cache)
  };

  CHECK(p.installed_root_dir == data / "engines" / "3.5.1-stable");
  CHECK(p.installed_binary_path ==
        data / "engines" / "3.5.1-stable" / "Godot_v3.5.1-stable_x11.64");
  CHECK(p.partial_root_dir == data / "engines" / ".3.5.1-stable.partial");
  CHECK(p.cached_archive_dir == cache / "engines" / "3.5.1-stable");
  CHECK(p.cached_archive_path ==
        cache / "engines" / "3.5.1-stable" / "Godot_v3.5.1-stable_x11.64.zip");
  CHECK(p.cached_digest_path ==
        cache / "engines" / "3.5.1-stable" / "Godot_v3.5.1-stable_x11.64.zip.sha256");
  CHECK(p.archive_name == "Godot_v3.5.1-stable_x11.64.zip");
}

TEST_CASE("store_layout: paths are stable across calls") {
  auto const spec{ version_spec::from("4.2") };
  auto const a{ store_layout_paths(spec, engine_platform::macos, "/d", "/c") };
  auto const b{ store_layout_paths(spec, engine_platform::macos, "/d", "/c") };
  CHECK(a.installed_binary_path == b.installed_binary_path);
  CHECK(a.cached_archive_path == b.cached_archive_path);
  CHECK(a.partial_root_dir == b.partial_root_dir);
}

TEST_CASE("store_layout: does not touch the filesystem") {
  auto const p{ store_layout_paths(version_spec::from("1.0"),
                                   engine_platform::linux64,
                                   "/nonexistent/gdenv-data",
                                   "/nonexistent/gdenv-cache") };
  CHECK_FALSE(std::filesystem::exists(p.installed_root_dir));
  CHECK_FALSE(std::filesystem::exists(p.cached_archive_dir));
}

}  // namespace gdenv
