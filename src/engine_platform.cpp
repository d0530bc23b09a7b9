#include "engine_platform.h"

#include "platform.h"

namespace gdenv {

engine_platform engine_platform_resolve() {
#if defined(_WIN32)
#if defined(_M_X64) || defined(__x86_64__)
  return engine_platform::windows64;
#elif defined(_M_IX86) || defined(__i386__)
  return engine_platform::windows32;
#else
  return engine_platform::unsupported;
#endif
#elif defined(__APPLE__) && defined(__MACH__)
  return engine_platform::macos;  // universal build covers both architectures
#elif defined(__linux__)
#if defined(__x86_64__)
  return engine_platform::linux64;
#elif defined(__i386__)
  return engine_platform::linux32;
#else
  return engine_platform::unsupported;
#endif
#else
  return engine_platform::unsupported;
#endif
}

std::string_view engine_platform_suffix(engine_platform p) {
  switch (p) {
    case engine_platform::windows32: return "win32.exe";
    case engine_platform::windows64: return "win64.exe";
    case engine_platform::macos: return "osx.universal";
    case engine_platform::linux32: return "x11.32";
    case engine_platform::linux64: return "x11.64";
    case engine_platform::unsupported: return "unsupported";
  }
  GDENV_UNREACHABLE();
}

std::string_view engine_platform_name(engine_platform p) {
  switch (p) {
    case engine_platform::windows32: return "windows32";
    case engine_platform::windows64: return "windows64";
    case engine_platform::macos: return "macos";
    case engine_platform::linux32: return "linux32";
    case engine_platform::linux64: return "linux64";
    case engine_platform::unsupported: return "unsupported";
  }
  GDENV_UNREACHABLE();
}

}  // namespace gdenv
