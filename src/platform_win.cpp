#ifdef _WIN32

#include "platform.h"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace gdenv::platform {

namespace {

// CommandLineToArgvW quoting rules.
void append_quoted_arg(std::wstring &cmdline, std::wstring const &arg) {
  if (!cmdline.empty()) { cmdline.push_back(L' '); }

  if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
    cmdline.append(arg);
    return;
  }

  cmdline.push_back(L'"');
  for (auto it{ arg.begin() };; ++it) {
    std::size_t backslashes{ 0 };
    while (it != arg.end() && *it == L'\\') {
      ++it;
      ++backslashes;
    }

    if (it == arg.end()) {
      cmdline.append(backslashes * 2, L'\\');
      break;
    }

    if (*it == L'"') {
      cmdline.append(backslashes * 2 + 1, L'\\');
    } else {
      cmdline.append(backslashes, L'\\');
    }
    cmdline.push_back(*it);
  }
  cmdline.push_back(L'"');
}

}  // namespace

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  // MOVEFILE_REPLACE_EXISTING is rejected for directory targets.
  DWORD flags{ MOVEFILE_WRITE_THROUGH };
  if (!std::filesystem::is_directory(from)) { flags |= MOVEFILE_REPLACE_EXISTING; }

  if (!::MoveFileExW(from.c_str(), to.c_str(), flags)) {
    throw std::system_error(::GetLastError(),
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  HANDLE const h{ ::CreateFileW(path.c_str(),
                                GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE,
                                nullptr,
                                OPEN_ALWAYS,
                                FILE_ATTRIBUTE_NORMAL,
                                nullptr) };

  if (h == INVALID_HANDLE_VALUE) {
    throw std::system_error(::GetLastError(),
                            std::system_category(),
                            "Failed to touch file: " + path.string());
  }

  ::CloseHandle(h);
}

void flush_directory(std::filesystem::path const &dir) {
  HANDLE const dir_h{ ::CreateFileW(dir.c_str(),
                                    GENERIC_READ,
                                    FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                                    nullptr,
                                    OPEN_EXISTING,
                                    FILE_FLAG_BACKUP_SEMANTICS,
                                    nullptr) };

  if (dir_h == INVALID_HANDLE_VALUE) {
    throw std::system_error(::GetLastError(),
                            std::system_category(),
                            "Failed to open directory for flush: " + dir.string());
  }

  // Directory handles do not always accept FlushFileBuffers; MoveFileExW already wrote
  // through.
  ::FlushFileBuffers(dir_h);
  ::CloseHandle(dir_h);
}

bool file_exists(std::filesystem::path const &path) {
  return ::GetFileAttributesW(path.c_str()) != INVALID_FILE_ATTRIBUTES;
}

std::optional<std::filesystem::path> get_default_cache_root() {
  if (char const *env_root{ std::getenv("GDENV_CACHE_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

  if (char const *local_app_data{ std::getenv("LOCALAPPDATA") }) {
    return std::filesystem::path{ local_app_data } / "gdenv";
  }

  if (char const *user_profile{ std::getenv("USERPROFILE") }) {
    return std::filesystem::path{ user_profile } / "AppData" / "Local" / "gdenv";
  }

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
  return "GDENV_CACHE_ROOT, LOCALAPPDATA or USERPROFILE";
}

std::optional<std::filesystem::path> get_default_data_root() {
  if (char const *env_root{ std::getenv("GDENV_DATA_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

  if (char const *app_data{ std::getenv("APPDATA") }) {
    return std::filesystem::path{ app_data } / "gdenv";
  }

  if (char const *user_profile{ std::getenv("USERPROFILE") }) {
    return std::filesystem::path{ user_profile } / "AppData" / "Roaming" / "gdenv";
  }

  return std::nullopt;
}

char const *get_default_data_root_env_vars() {
  return "GDENV_DATA_ROOT, APPDATA or USERPROFILE";
}

std::optional<std::string> get_env(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("get_env: null name"); }
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

std::int64_t spawn_detached(std::filesystem::path const &binary,
                            spawn_options const &options) {
  std::wstring cmdline;
  append_quoted_arg(cmdline, binary.wstring());
  for (auto const &arg : options.args) {
    append_quoted_arg(cmdline, std::filesystem::path{ arg }.wstring());
  }
  std::vector<wchar_t> cmdline_buf{ cmdline.begin(), cmdline.end() };
  cmdline_buf.push_back(L'\0');

  STARTUPINFOW si{};
  si.cb = sizeof si;

  DWORD creation_flags{ CREATE_NEW_PROCESS_GROUP | CREATE_UNICODE_ENVIRONMENT };
  if (options.detach_stdio) { creation_flags |= DETACHED_PROCESS; }

  std::wstring const cwd{ options.cwd ? options.cwd->wstring() : std::wstring{} };

  PROCESS_INFORMATION pi{};
  if (!::CreateProcessW(binary.c_str(),
                        cmdline_buf.data(),
                        nullptr,
                        nullptr,
                        FALSE,
                        creation_flags,
                        nullptr,
                        options.cwd ? cwd.c_str() : nullptr,
                        &si,
                        &pi)) {
    throw std::system_error(::GetLastError(),
                            std::system_category(),
                            "Failed to launch " + binary.string());
  }

  std::int64_t const pid{ static_cast<std::int64_t>(pi.dwProcessId) };
  ::CloseHandle(pi.hThread);
  ::CloseHandle(pi.hProcess);
  return pid;
}

}  // namespace gdenv::platform

#endif  // _WIN32
