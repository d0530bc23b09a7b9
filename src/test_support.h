#pragma once

// Fixtures shared by unit tests. Linked into the test binary only.

#include "util.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gdenv::test {

struct archive_entry_spec {
  std::string path;      // relative path inside the archive; trailing '/' for dirs
  std::string content;   // ignored for directories
  int mode{ 0644 };
};

// Build a zip archive in memory with libarchive's writer.
std::vector<unsigned char> make_zip(std::vector<archive_entry_spec> const &entries);

// Fresh directory under temp_directory_path(), removed on destruction.
class temp_dir : unmovable {
 public:
  explicit temp_dir(std::string_view prefix);
  ~temp_dir();

  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Regular files below root as sorted "relative/path" strings.
std::vector<std::string> list_files(std::filesystem::path const &root);

std::string read_text(std::filesystem::path const &path);

}  // namespace gdenv::test
