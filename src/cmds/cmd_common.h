#pragma once

#include "cmd.h"
#include "release_index.h"
#include "store.h"
#include "transport.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace gdenv {

// CLI value, then environment, then the platform default. Throws std::runtime_error
// naming the environment variables when none applies.
std::filesystem::path resolve_data_root(
    std::optional<std::filesystem::path> const &data_root);
std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root);

// Store over the resolved roots for the host platform.
std::unique_ptr<store> open_store(cli_roots const &roots,
                                  std::string product_name = std::string{
                                      kDefaultProductName });

std::string user_agent();

// Release index and transport for the configured release source.
class release_client : unmovable {
 public:
  explicit release_client(release_source_cfg cfg = release_source_cfg::from_env());

  release_source_cfg const &cfg() const { return cfg_; }
  release_index &index() { return index_; }
  byte_transport &transport() { return transport_; }

 private:
  release_source_cfg cfg_;
  curl_transport transport_;
  github_release_index index_;
};

}  // namespace gdenv
