#ifndef _WIN32

#include "platform.h"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace gdenv::platform {

namespace {

struct fd_cleanup : unmovable {
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() { reset(); }

  int get() const { return fd_; }
  void reset() {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

void set_cloexec(int fd) {
  int const flags{ ::fcntl(fd, F_GETFD) };
  if (flags == -1 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "fcntl(FD_CLOEXEC) failed");
  }
}

// Child side of spawn_detached. Reports errno through err_fd if anything fails before
// exec; a successful exec closes err_fd via FD_CLOEXEC and the parent reads EOF.
[[noreturn]] void exec_detached_child(int err_fd,
                                      std::filesystem::path const &binary,
                                      std::vector<char *> const &argv,
                                      spawn_options const &options) {
  auto const fail{ [err_fd] {
    int const err{ errno };
    ssize_t const ignored{ ::write(err_fd, &err, sizeof err) };
    static_cast<void>(ignored);
    _exit(127);
  } };

  if (::setsid() == -1) { fail(); }

  if (options.detach_stdio) {
    int const null_fd{ ::open("/dev/null", O_RDWR) };
    if (null_fd == -1) { fail(); }
    for (int const target : { STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO }) {
      if (::dup2(null_fd, target) == -1) { fail(); }
    }
    if (null_fd > STDERR_FILENO) { ::close(null_fd); }
  }

  if (options.cwd && ::chdir(options.cwd->c_str()) == -1) { fail(); }

  ::execv(binary.c_str(), argv.data());
  fail();
}

}  // namespace

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_WRONLY, 0644) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to touch file: " + path.string());
  }
  if (::close(fd) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to close touched file: " + path.string());
  }
}

void flush_directory(std::filesystem::path const &dir) {
  int const fd{ ::open(dir.c_str(), O_RDONLY) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open directory for flush: " + dir.string());
  }
  fd_cleanup const guard{ fd };

  // Some filesystems reject fsync on directories; the rename is still visible.
  if (::fsync(fd) != 0 && errno != EINVAL && errno != ENOTSUP) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to flush directory: " + dir.string());
  }
}

bool file_exists(std::filesystem::path const &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

std::optional<std::filesystem::path> get_default_cache_root() {
  if (char const *env_root{ std::getenv("GDENV_CACHE_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Caches" / "gdenv";
  }
#else
  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg_cache } / "gdenv";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "gdenv";
  }
#endif

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
#ifdef __APPLE__
  return "GDENV_CACHE_ROOT or HOME";
#else
  return "GDENV_CACHE_ROOT, XDG_CACHE_HOME or HOME";
#endif
}

std::optional<std::filesystem::path> get_default_data_root() {
  if (char const *env_root{ std::getenv("GDENV_DATA_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Application Support" / "gdenv";
  }
#else
  if (char const *xdg_data{ std::getenv("XDG_DATA_HOME") }) {
    return std::filesystem::path{ xdg_data } / "gdenv";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".local" / "share" / "gdenv";
  }
#endif

  return std::nullopt;
}

char const *get_default_data_root_env_vars() {
#ifdef __APPLE__
  return "GDENV_DATA_ROOT or HOME";
#else
  return "GDENV_DATA_ROOT, XDG_DATA_HOME or HOME";
#endif
}

std::optional<std::string> get_env(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("get_env: null name"); }
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}


std::int64_t spawn_detached(std::filesystem::path const &binary,
                            spawn_options const &options) {
  std::vector<std::string> argv_strings;
  argv_strings.reserve(options.args.size() + 1);
  argv_strings.push_back(binary.string());
  argv_strings.insert(argv_strings.end(), options.args.begin(), options.args.end());

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto &arg : argv_strings) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);

  int err_pipe[2];
  if (::pipe(err_pipe) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup err_read{ err_pipe[0] };
  fd_cleanup err_write{ err_pipe[1] };
  set_cloexec(err_read.get());
  set_cloexec(err_write.get());

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) { exec_detached_child(err_write.get(), binary, argv, options); }

  err_write.reset();

  int child_errno{ 0 };
  ssize_t n{ 0 };
  do {
    n = ::read(err_read.get(), &child_errno, sizeof child_errno);
  } while (n == -1 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof child_errno)) {
    int status{ 0 };
    ::waitpid(child, &status, 0);
    throw std::system_error(child_errno,
                            std::generic_category(),
                            "Failed to launch " + binary.string());
  }

  return static_cast<std::int64_t>(child);
}

}  // namespace gdenv::platform

#endif  // POSIX implementation
