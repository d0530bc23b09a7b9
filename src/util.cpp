#include "util.h"

#include <array>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace gdenv {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char kDigits[]{ "0123456789abcdef" };

  std::string hex(length * 2, '\0');
  auto const *bytes{ static_cast<unsigned char const *>(data) };
  for (size_t i{ 0 }; i < length; ++i) {
    hex[2 * i] = kDigits[bytes[i] >> 4];
    hex[2 * i + 1] = kDigits[bytes[i] & 0x0f];
  }
  return hex;
}

int util_hex_char_to_int(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return 10 + (c - 'a'); }
  if (c >= 'A' && c <= 'F') { return 10 + (c - 'A'); }
  return -1;
}

std::vector<unsigned char> util_hex_to_bytes(std::string const &hex) {
  if (hex.size() % 2) {
    throw std::runtime_error("util_hex_to_bytes: need an even length, got " +
                             std::to_string(hex.size()));
  }

  std::vector<unsigned char> bytes(hex.size() / 2);
  for (size_t i{ 0 }; i < hex.size(); ++i) {
    int const nibble{ util_hex_char_to_int(hex[i]) };
    if (nibble < 0) {
      throw std::runtime_error("util_hex_to_bytes: bad hex digit at position " +
                               std::to_string(i));
    }
    bytes[i / 2] = static_cast<unsigned char>(bytes[i / 2] << 4 | nibble);
  }
  return bytes;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
#if defined(_WIN32)
  std::wstring wide_mode;
  wide_mode.reserve(std::strlen(mode));
  for (char const *p{ mode }; *p != '\0'; ++p) {
    wide_mode.push_back(static_cast<wchar_t>(*p));
  }
  return file_ptr_t{ _wfopen(path.c_str(), wide_mode.c_str()) };
#else
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
#endif
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  std::vector<unsigned char> contents;
  std::array<unsigned char, 64 * 1024> chunk{};
  for (;;) {
    size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    contents.insert(contents.end(), chunk.begin(), chunk.begin() + n);
    if (n < chunk.size()) { break; }
  }

  if (std::ferror(file.get())) {
    throw std::runtime_error("util_load_file: read error on " + path.string());
  }
  return contents;
}

void util_write_file(std::filesystem::path const &path, void const *data, size_t length) {
  if (auto const parent{ path.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("util_write_file: failed to create directory " +
                               parent.string() + ": " + ec.message());
    }
  }

  scoped_path_cleanup partial{ std::filesystem::path{} };

  {
    auto file{ util_open_file(path, "wb") };
    if (!file) {
      throw std::runtime_error("util_write_file: failed to open " + path.string());
    }
    partial.reset(path);

    if (length > 0 && std::fwrite(data, 1, length, file.get()) != length) {
      throw std::runtime_error("util_write_file: short write to " + path.string());
    }

    if (std::fflush(file.get()) != 0) {
      throw std::runtime_error("util_write_file: failed to flush " + path.string());
    }

    if (std::fclose(file.release()) != 0) {
      throw std::runtime_error("util_write_file: failed to close " + path.string());
    }
  }

  partial.release();
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  util_write_file(path, content.data(), content.size());
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(2) << value << kUnits[unit];
  return oss.str();
}

std::uint64_t util_directory_size(std::filesystem::path const &root) {
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) { return 0; }

  if (std::filesystem::is_regular_file(root, ec)) {
    return std::filesystem::file_size(root, ec);
  }

  std::uint64_t total{ 0 };
  for (std::filesystem::recursive_directory_iterator it{ root, ec }, end; !ec && it != end;
       it.increment(ec)) {
    std::error_code size_ec;
    if (it->is_regular_file(size_ec)) {
      auto const size{ it->file_size(size_ec) };
      if (!size_ec) { total += size; }
    }
  }

  if (ec) {
    throw std::runtime_error("util_directory_size: failed to walk " + root.string() +
                             ": " + ec.message());
  }

  return total;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace gdenv
