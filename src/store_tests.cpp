#include "store.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace gdenv {

namespace {

struct store_fixture {
  store_fixture()
      : tmp{ "gdenv-store-test" },
        st{ tmp.path() / "data", tmp.path() / "cache", engine_platform::linux64 } {}

  void install_binary(std::string const &requested) {
    util_write_file(st.paths(version_spec::from(requested)).installed_binary_path, "bin");
  }

  void cache_archive(std::string const &requested, std::string const &content = "zip") {
    util_write_file(st.paths(version_spec::from(requested)).cached_archive_path, content);
  }

  test::temp_dir tmp;
  store st;
};

std::vector<std::string> canonicals(auto const &entries) {
  std::vector<std::string> out;
  for (auto const &e : entries) { out.push_back(e.canonical); }
  return out;
}

}  // namespace

TEST_CASE_FIXTURE(store_fixture, "store: installation state follows the filesystem") {
  auto const spec{ version_spec::from("3.5.1") };
  CHECK(st.state(spec) == installation_state::not_installed);

  cache_archive("3.5.1");
  CHECK(st.state(spec) == installation_state::cached_only);

  install_binary("3.5.1");
  CHECK(st.state(spec) == installation_state::installed);

  std::filesystem::remove_all(st.paths(spec).cached_archive_dir);
  CHECK(st.state(spec) == installation_state::installed);
}

TEST_CASE_FIXTURE(store_fixture, "store: install dir without binary is not installed") {
  auto const spec{ version_spec::from("3.5.1") };
  std::filesystem::create_directories(st.paths(spec).installed_root_dir);
  CHECK(st.state(spec) == installation_state::not_installed);
}

TEST_CASE_FIXTURE(store_fixture, "store: list_installed newest first, binary required") {
  install_binary("3.5.1");
  install_binary("4.2");
  install_binary("4.2.2");
  install_binary("3.6");
  std::filesystem::create_directories(st.data_root() / "engines" / "4.3-stable");
  std::filesystem::create_directories(st.data_root() / "engines" / ".4.4-stable.partial");
  std::filesystem::create_directories(st.data_root() / "engines" / "random-dir");

  CHECK(canonicals(st.list_installed()) ==
        std::vector<std::string>{ "4.2.2-stable", "4.2-stable", "3.6-stable", "3.5.1-stable" });
}

TEST_CASE_FIXTURE(store_fixture, "store: list_installed ignores other platforms") {
  util_write_file(st.data_root() / "engines" / "3.5.1-stable" /
                      "Godot_v3.5.1-stable_win64.exe",
                  "bin");
  CHECK(st.list_installed().empty());
}

TEST_CASE_FIXTURE(store_fixture, "store: list_installed with missing data root") {
  CHECK(st.list_installed().empty());
  CHECK(st.list_cached().empty());
}

TEST_CASE_FIXTURE(store_fixture, "store: list_cached reports archives and sizes") {
  cache_archive("3.5.1", std::string(1234, 'x'));
  cache_archive("4.2", "abc");
  util_write_file(st.paths(version_spec::from("4.2")).cached_digest_path, "digest");

  auto const cached{ st.list_cached() };
  REQUIRE(cached.size() == 2);
  CHECK(cached[0].canonical == "4.2-stable");
  CHECK(cached[0].size_bytes == 3);
  CHECK(cached[1].canonical == "3.5.1-stable");
  CHECK(cached[1].size_bytes == 1234);
  CHECK(cached[1].archive_path == st.paths(version_spec::from("3.5.1")).cached_archive_path);
}

TEST_CASE_FIXTURE(store_fixture, "store: remove_cached leaves installs alone") {
  cache_archive("3.5.1");
  install_binary("3.5.1");
  auto const spec{ version_spec::from("3.5.1") };

  CHECK(st.remove_cached(spec));
  CHECK_FALSE(std::filesystem::exists(st.paths(spec).cached_archive_dir));
  CHECK(st.state(spec) == installation_state::installed);
  CHECK_FALSE(st.remove_cached(spec));
}

TEST_CASE_FIXTURE(store_fixture, "store: remove_all_cached") {
  cache_archive("3.5.1");
  cache_archive("4.2");
  CHECK(st.remove_all_cached() == 2);
  CHECK(st.list_cached().empty());
  CHECK(st.remove_all_cached() == 0);
}

TEST_CASE_FIXTURE(store_fixture, "store: remove_installed never touches the cache") {
  cache_archive("3.5.1");
  install_binary("3.5.1");
  auto const spec{ version_spec::from("3.5.1") };

  CHECK(st.remove_installed(spec));
  CHECK(st.state(spec) == installation_state::cached_only);
  CHECK_FALSE(st.remove_installed(spec));
}

TEST_CASE("installation_state_name") {
  CHECK(installation_state_name(installation_state::not_installed) == "not_installed");
  CHECK(installation_state_name(installation_state::installed) == "installed");
  CHECK(installation_state_name(installation_state::cached_only) == "cached_only");
}

}  // namespace gdenv
