#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gdenv {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

std::string util_bytes_to_hex(void const *data, size_t length);

// Accepts either case; throws std::runtime_error on odd length or a non-hex digit.
std::vector<unsigned char> util_hex_to_bytes(std::string const &hex);

// Value of a single hex digit, or -1.
int util_hex_char_to_int(char c);

struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// nullptr on failure. Wide-character open on Windows.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Whole file contents; throws std::runtime_error when unreadable.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Write bytes to path (truncating), creating parent directories. The file is flushed
// and closed before returning; throws std::runtime_error on any failure and removes
// the partially written file.
void util_write_file(std::filesystem::path const &path, void const *data, size_t length);
void util_write_file(std::filesystem::path const &path, std::string_view content);

// 1536 -> "1.50KB", 512 -> "512B".
std::string util_format_bytes(std::uint64_t bytes);

// Sum of regular file sizes below root (0 if root is missing).
std::uint64_t util_directory_size(std::filesystem::path const &root);

// Removes the held path (file or directory tree) on destruction unless released.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  void release() { path_.clear(); }
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace gdenv
