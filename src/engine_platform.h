#pragma once

#include <string_view>

namespace gdenv {

// Release-packaging platforms. Every variant, including unsupported, has a suffix so
// path construction never fails on the platform alone.
enum class engine_platform {
  windows32,
  windows64,
  macos,
  linux32,
  linux64,
  unsupported,
};

// Host platform, determined from compile-time target information.
engine_platform engine_platform_resolve();

// Artifact-name suffix used by the release packaging, e.g. "x11.64".
std::string_view engine_platform_suffix(engine_platform p);

std::string_view engine_platform_name(engine_platform p);

}  // namespace gdenv
