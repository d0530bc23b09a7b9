#pragma once

#include "transport.h"
#include "util.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdenv {

struct release_asset {
  std::string name;
  std::string download_url;
  std::optional<std::string> sha256;  // lowercase hex, when the index publishes one
};

struct release_record {
  std::string tag_name;
  std::vector<release_asset> assets;
};

// Remote catalogue of engine releases. find_by_tag returns nullopt only when the
// release does not exist; transport and format failures throw std::runtime_error.
class release_index : unmovable {
 public:
  virtual ~release_index() = default;

  virtual std::optional<release_record> find_by_tag(std::string_view tag) = 0;
  virtual std::vector<std::string> list_tags() = 0;
};

struct release_source_cfg {
  std::string owner{ "godotengine" };
  std::string repo{ "godot" };
  std::string api_base{ "https://api.github.com" };
  std::string product_name{ "Godot" };
  std::optional<std::string> token;  // sent as a bearer token when present

  // Defaults, with GDENV_RELEASES_API and GITHUB_TOKEN applied.
  static release_source_cfg from_env();
};

// GitHub releases REST API.
class github_release_index : public release_index {
 public:
  static constexpr int kPageSize{ 100 };

  github_release_index(release_source_cfg cfg, byte_transport &transport);

  std::optional<release_record> find_by_tag(std::string_view tag) override;
  std::vector<std::string> list_tags() override;

  // Request headers for both API and asset downloads.
  std::vector<std::string> headers() const;

 private:
  release_source_cfg cfg_;
  byte_transport &transport_;
};

// Parse a single GitHub release object. Throws std::runtime_error if malformed.
release_record release_record_parse_json(std::string_view json);

// Parse a page of the release listing into tag names. Throws std::runtime_error if
// malformed.
std::vector<std::string> release_tags_parse_json(std::string_view json);

}  // namespace gdenv
