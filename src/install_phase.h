#pragma once

#include <string_view>

namespace gdenv {

enum class install_phase : int {
  none = -1,  // Not started yet
  check_installed = 0,
  check_cache = 1,
  locate = 2,
  fetch = 3,
  extract = 4,
  finalize = 5,
  done = 6,  // Terminal state, success or short-circuit
};

std::string_view install_phase_name(install_phase p);

}  // namespace gdenv
