#include "cmd_version.h"

#include "libcurl_util.h"
#include "tui.h"

#include "CLI11.hpp"
#include "archive.h"
#include "mbedtls/version.h"
#include "semver.hpp"

#include <array>
#include <memory>
#include <utility>

#ifndef GDENV_VERSION_STR
#error "GDENV_VERSION_STR must be defined by the build system"
#endif

namespace gdenv {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, cli_roots const & /*roots*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("gdenv version %s", GDENV_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  libcurl: %s", libcurl_version().c_str());

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  Semver: %d.%d.%d",
            SEMVER_VERSION_MAJOR,
            SEMVER_VERSION_MINOR,
            SEMVER_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace gdenv
