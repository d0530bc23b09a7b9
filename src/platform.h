#pragma once

#include "util.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Platform-specific unreachable hint. Use compiler intrinsics where available
// while remaining safe for MSVC which lacks __builtin_unreachable.
#if defined(_MSC_VER)
#define GDENV_UNREACHABLE() __assume(0)
#else
#define GDENV_UNREACHABLE() __builtin_unreachable()
#endif

namespace gdenv::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void touch_file(std::filesystem::path const &path);
void flush_directory(std::filesystem::path const &dir);
bool file_exists(std::filesystem::path const &path);

// GDENV_CACHE_ROOT, then the OS cache location.
std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

// GDENV_DATA_ROOT, then the OS per-user data location.
std::optional<std::filesystem::path> get_default_data_root();
char const *get_default_data_root_env_vars();

std::optional<std::string> get_env(char const *name);

struct spawn_options {
  std::vector<std::string> args;  // argv[1..]; argv[0] is the binary
  std::optional<std::filesystem::path> cwd;
  bool detach_stdio{ false };  // stdin/stdout/stderr to the null device
};

// Start binary in its own session/process group and return without waiting. Throws
// std::system_error if the process could not be created (including exec failure).
std::int64_t spawn_detached(std::filesystem::path const &binary,
                            spawn_options const &options);

}  // namespace gdenv::platform
