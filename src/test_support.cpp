#include "test_support.h"

#include "archive.h"
#include "archive_entry.h"

#include <algorithm>
#include <memory>
#include <random>
#include <stdexcept>

namespace gdenv::test {

namespace {

struct archive_mem_writer : unmovable {
  archive_mem_writer() : handle(archive_write_new()) {
    if (!handle) { throw std::runtime_error("archive_write_new failed"); }
  }

  ~archive_mem_writer() {
    if (handle) { archive_write_free(handle); }
  }

  archive *handle{ nullptr };
};

void check(archive *a, int rc, char const *what) {
  if (rc != ARCHIVE_OK) {
    char const *msg{ archive_error_string(a) };
    throw std::runtime_error(std::string{ what } + " failed: " + (msg ? msg : "unknown"));
  }
}

}  // namespace

std::vector<unsigned char> make_zip(std::vector<archive_entry_spec> const &entries) {
  archive_mem_writer writer;
  check(writer.handle, archive_write_set_format_zip(writer.handle), "set_format_zip");

  // Worst-case output size: contents stored uncompressed plus generous per-entry headers
  std::size_t capacity{ 4096 };
  for (auto const &e : entries) { capacity += e.content.size() + e.path.size() * 3 + 512; }

  std::vector<unsigned char> buffer(capacity);
  std::size_t used{ 0 };
  check(writer.handle,
        archive_write_open_memory(writer.handle, buffer.data(), buffer.size(), &used),
        "write_open_memory");

  for (auto const &e : entries) {
    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry{
      archive_entry_new(),
      &archive_entry_free
    };
    if (!entry) { throw std::runtime_error("archive_entry_new failed"); }

    bool const is_dir{ !e.path.empty() && e.path.back() == '/' };
    archive_entry_set_pathname(entry.get(), e.path.c_str());
    archive_entry_set_filetype(entry.get(), is_dir ? AE_IFDIR : AE_IFREG);
    archive_entry_set_perm(entry.get(), is_dir ? 0755 : e.mode);
    archive_entry_set_size(entry.get(),
                           is_dir ? 0 : static_cast<la_int64_t>(e.content.size()));
    archive_entry_set_mtime(entry.get(), 1700000000, 0);

    check(writer.handle, archive_write_header(writer.handle, entry.get()), "write_header");
    if (!is_dir && !e.content.empty()) {
      la_ssize_t const written{
        archive_write_data(writer.handle, e.content.data(), e.content.size())
      };
      if (written < 0) { check(writer.handle, ARCHIVE_FATAL, "write_data"); }
    }
  }

  check(writer.handle, archive_write_close(writer.handle), "write_close");
  buffer.resize(used);
  return buffer;
}

temp_dir::temp_dir(std::string_view prefix) {
  static std::mt19937_64 rng{ std::random_device{}() };
  path_ = std::filesystem::temp_directory_path() /
          (std::string{ prefix } + "-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

temp_dir::~temp_dir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::vector<std::string> list_files(std::filesystem::path const &root) {
  std::vector<std::string> files;
  if (!std::filesystem::exists(root)) { return files; }
  for (auto const &entry : std::filesystem::recursive_directory_iterator{ root }) {
    if (!entry.is_regular_file()) { continue; }
    files.push_back(entry.path().lexically_relative(root).generic_string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string read_text(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

}  // namespace gdenv::test
