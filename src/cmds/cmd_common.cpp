#include "cmd_common.h"

#include "engine_platform.h"
#include "platform.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

#ifndef GDENV_VERSION_STR
#error "GDENV_VERSION_STR must be defined by the build system"
#endif

namespace gdenv {

std::filesystem::path resolve_data_root(
    std::optional<std::filesystem::path> const &data_root) {
  if (data_root) { return *data_root; }

  auto default_data_root{ platform::get_default_data_root() };
  if (!default_data_root) {
    throw std::runtime_error(std::string{ "could not determine data root; set " } +
                             platform::get_default_data_root_env_vars() +
                             " or pass --data-root");
  }
  return *default_data_root;
}

std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root) {
  if (cache_root) { return *cache_root; }

  auto default_cache_root{ platform::get_default_cache_root() };
  if (!default_cache_root) {
    throw std::runtime_error(std::string{ "could not determine cache root; set " } +
                             platform::get_default_cache_root_env_vars() +
                             " or pass --cache-root");
  }
  return *default_cache_root;
}

std::unique_ptr<store> open_store(cli_roots const &roots, std::string product_name) {
  auto st{ std::make_unique<store>(resolve_data_root(roots.data_root),
                                   resolve_cache_root(roots.cache_root),
                                   engine_platform_resolve(),
                                   std::move(product_name)) };
  tui::debug("data root: %s", st->data_root().string().c_str());
  tui::debug("cache root: %s", st->cache_root().string().c_str());
  tui::debug("platform: %s", std::string{ engine_platform_name(st->platform()) }.c_str());
  return st;
}

std::string user_agent() { return std::string{ "gdenv/" } + GDENV_VERSION_STR; }

release_client::release_client(release_source_cfg cfg)
    : cfg_{ std::move(cfg) }, transport_{ user_agent() }, index_{ cfg_, transport_ } {
  tui::debug("release source: %s/repos/%s/%s",
             cfg_.api_base.c_str(),
             cfg_.owner.c_str(),
             cfg_.repo.c_str());
}

}  // namespace gdenv
