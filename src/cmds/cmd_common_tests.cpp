#include "cmds/cmd_common.h"

#include "engine_platform.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <optional>

TEST_CASE("resolve roots prefer the command-line value") {
  CHECK(gdenv::resolve_data_root(std::filesystem::path{ "/cli/data" }) ==
        std::filesystem::path{ "/cli/data" });
  CHECK(gdenv::resolve_cache_root(std::filesystem::path{ "/cli/cache" }) ==
        std::filesystem::path{ "/cli/cache" });
}

TEST_CASE("open_store uses the given roots and the host platform") {
  gdenv::test::temp_dir const tmp{ "gdenv-cmd-test" };
  gdenv::cli_roots const roots{ .data_root = tmp.path() / "data",
                                .cache_root = tmp.path() / "cache" };

  auto const st{ gdenv::open_store(roots) };
  CHECK(st->data_root() == tmp.path() / "data");
  CHECK(st->cache_root() == tmp.path() / "cache");
  CHECK(st->platform() == gdenv::engine_platform_resolve());
  CHECK(st->product_name() == "Godot");

  auto const renamed{ gdenv::open_store(roots, "Redot") };
  CHECK(renamed->product_name() == "Redot");
}

TEST_CASE("user_agent names the tool") {
  CHECK(gdenv::user_agent().rfind("gdenv/", 0) == 0);
}
