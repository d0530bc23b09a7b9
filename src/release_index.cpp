#include "release_index.h"

#include "libcurl_util.h"
#include "platform.h"
#include "sha256.h"
#include "tui.h"

#include "picojson.h"

#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace gdenv {

namespace {

picojson::value parse_json(std::string_view json, char const *what) {
  picojson::value root;
  std::string const json_str{ json };
  std::string const err{ picojson::parse(root, json_str) };
  if (!err.empty()) {
    throw std::runtime_error(std::string{ "Malformed " } + what + ": " + err);
  }
  return root;
}

std::string const &require_string(picojson::object const &obj,
                                  char const *key,
                                  char const *what) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<std::string>()) {
    throw std::runtime_error(std::string{ "Malformed " } + what + ": missing string '" +
                             key + "'");
  }
  return it->second.get<std::string>();
}

release_record record_from_object(picojson::object const &obj) {
  release_record record;
  record.tag_name = require_string(obj, "tag_name", "release");

  auto const assets_it{ obj.find("assets") };
  if (assets_it == obj.end()) { return record; }
  if (!assets_it->second.is<picojson::array>()) {
    throw std::runtime_error("Malformed release: 'assets' is not an array");
  }

  for (auto const &asset_value : assets_it->second.get<picojson::array>()) {
    if (!asset_value.is<picojson::object>()) {
      throw std::runtime_error("Malformed release: asset is not an object");
    }
    auto const &asset_obj{ asset_value.get<picojson::object>() };

    release_asset asset{
      .name = require_string(asset_obj, "name", "release asset"),
      .download_url = require_string(asset_obj, "browser_download_url", "release asset"),
      .sha256 = std::nullopt,
    };

    auto const digest_it{ asset_obj.find("digest") };
    if (digest_it != asset_obj.end() && digest_it->second.is<std::string>()) {
      asset.sha256 = sha256_from_digest_field(digest_it->second.get<std::string>());
    }

    record.assets.push_back(std::move(asset));
  }

  return record;
}

}  // namespace

release_record release_record_parse_json(std::string_view json) {
  picojson::value const root{ parse_json(json, "release") };
  if (!root.is<picojson::object>()) {
    throw std::runtime_error("Malformed release: expected a JSON object");
  }
  return record_from_object(root.get<picojson::object>());
}

std::vector<std::string> release_tags_parse_json(std::string_view json) {
  picojson::value const root{ parse_json(json, "release list") };
  if (!root.is<picojson::array>()) {
    throw std::runtime_error("Malformed release list: expected a JSON array");
  }

  std::vector<std::string> tags;
  for (auto const &item : root.get<picojson::array>()) {
    if (!item.is<picojson::object>()) {
      throw std::runtime_error("Malformed release list: entry is not an object");
    }
    tags.push_back(require_string(item.get<picojson::object>(), "tag_name", "release"));
  }
  return tags;
}

release_source_cfg release_source_cfg::from_env() {
  release_source_cfg cfg;
  if (auto api{ platform::get_env("GDENV_RELEASES_API") }; api && !api->empty()) {
    while (!api->empty() && api->back() == '/') { api->pop_back(); }
    cfg.api_base = std::move(*api);
  }
  if (auto token{ platform::get_env("GITHUB_TOKEN") }; token && !token->empty()) {
    cfg.token = std::move(*token);
  }
  return cfg;
}

github_release_index::github_release_index(release_source_cfg cfg,
                                           byte_transport &transport)
    : cfg_{ std::move(cfg) }, transport_{ transport } {}

std::vector<std::string> github_release_index::headers() const {
  std::vector<std::string> result{ "Accept: application/vnd.github+json",
                                   "X-GitHub-Api-Version: 2022-11-28" };
  if (cfg_.token) { result.push_back("Authorization: Bearer " + *cfg_.token); }
  return result;
}

std::optional<release_record> github_release_index::find_by_tag(std::string_view tag) {
  std::string const url{ cfg_.api_base + "/repos/" + cfg_.owner + "/" + cfg_.repo +
                         "/releases/tags/" + libcurl_escape(tag) };
  tui::debug("release index: GET %s", url.c_str());

  http_response const response{ transport_.get(url, headers()) };
  if (response.status == 404) { return std::nullopt; }
  if (!response.ok()) {
    throw std::runtime_error("Release index request " + url + " returned HTTP " +
                             std::to_string(response.status));
  }

  return release_record_parse_json(response.text());
}

std::vector<std::string> github_release_index::list_tags() {
  std::vector<std::string> tags;

  for (int page{ 1 };; ++page) {
    std::string const url{ cfg_.api_base + "/repos/" + cfg_.owner + "/" + cfg_.repo +
                           "/releases?per_page=" + std::to_string(kPageSize) +
                           "&page=" + std::to_string(page) };
    tui::debug("release index: GET %s", url.c_str());

    http_response const response{ transport_.get(url, headers()) };
    if (!response.ok()) {
      throw std::runtime_error("Release index request " + url + " returned HTTP " +
                               std::to_string(response.status));
    }

    auto page_tags{ release_tags_parse_json(response.text()) };
    if (page_tags.empty()) { break; }

    tags.insert(tags.end(),
                std::make_move_iterator(page_tags.begin()),
                std::make_move_iterator(page_tags.end()));
    if (static_cast<int>(page_tags.size()) < kPageSize) { break; }
  }

  return tags;
}

}  // namespace gdenv
