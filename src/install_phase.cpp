#include "install_phase.h"

namespace gdenv {

std::string_view install_phase_name(install_phase p) {
  switch (p) {
    case install_phase::none: return "none";
    case install_phase::check_installed: return "check_installed";
    case install_phase::check_cache: return "check_cache";
    case install_phase::locate: return "locate";
    case install_phase::fetch: return "fetch";
    case install_phase::extract: return "extract";
    case install_phase::finalize: return "finalize";
    case install_phase::done: return "done";
  }
  return "unknown";
}

}  // namespace gdenv
