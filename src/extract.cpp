#include "extract.h"

#include "archive.h"
#include "archive_entry.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace gdenv {
namespace {

constexpr std::size_t kCopyBufferSize{ 1024 * 1024 };
constexpr std::size_t kReadBlockSize{ 10240 };

struct read_closer {
  void operator()(archive *a) const noexcept {
    archive_read_close(a);
    archive_read_free(a);
  }
};

struct write_closer {
  void operator()(archive *a) const noexcept {
    archive_write_close(a);
    archive_write_free(a);
  }
};

using reader_ptr = std::unique_ptr<archive, read_closer>;
using writer_ptr = std::unique_ptr<archive, write_closer>;

[[noreturn]] void throw_archive_error(char const *what, archive *a) {
  char const *detail{ archive_error_string(a) };
  throw std::runtime_error(std::string{ what } + ": " + (detail ? detail : "unknown error"));
}

reader_ptr new_reader() {
  reader_ptr reader{ archive_read_new() };
  if (!reader) { throw std::runtime_error("archive_read_new failed"); }
  archive_read_support_filter_all(reader.get());
  archive_read_support_format_all(reader.get());
  return reader;
}

writer_ptr new_disk_writer() {
  writer_ptr writer{ archive_write_disk_new() };
  if (!writer) { throw std::runtime_error("archive_write_disk_new failed"); }
  archive_write_disk_set_options(writer.get(),
                                 ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);
  archive_write_disk_set_standard_lookup(writer.get());
  return writer;
}

// Relative entry path, or throws if it is absolute or climbs out with "..".
std::filesystem::path contained_path(char const *name) {
  std::filesystem::path const rel{ name };
  if (rel.empty() || rel.has_root_name() || rel.has_root_directory()) {
    throw std::runtime_error(std::string{ "Refusing archive entry with absolute path: " } +
                             name);
  }
  for (auto const &part : rel) {
    if (part == "..") {
      throw std::runtime_error(
          std::string{ "Refusing archive entry outside destination: " } + name);
    }
  }
  return rel;
}

void copy_entry_data(archive *in, archive *out, std::vector<char> &buffer) {
  for (;;) {
    la_ssize_t const n{ archive_read_data(in, buffer.data(), buffer.size()) };
    if (n == 0) { return; }
    if (n < 0) { throw_archive_error("Failed to read entry data", in); }
    if (archive_write_data(out, buffer.data(), static_cast<std::size_t>(n)) < 0) {
      throw_archive_error("Failed to write entry data", out);
    }
  }
}

std::uint64_t unpack(archive *in,
                     std::filesystem::path const &destination,
                     std::string const &source_name) {
  auto const writer{ new_disk_writer() };
  auto const root{ std::filesystem::absolute(destination).lexically_normal() };
  std::filesystem::create_directories(root);

  std::vector<char> buffer(kCopyBufferSize);
  std::uint64_t files{ 0 };
  archive_entry *entry{ nullptr };

  for (int r{ archive_read_next_header(in, &entry) }; r != ARCHIVE_EOF;
       r = archive_read_next_header(in, &entry)) {
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw_archive_error("Failed to read archive header", in);
    }

    char const *name{ archive_entry_pathname(entry) };
    if (!name) { throw std::runtime_error("Archive entry has no pathname"); }

    auto const target{ root / contained_path(name) };
    if (auto const parent{ target.parent_path() }; !parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw std::runtime_error("Failed to create directory " + parent.string() + ": " +
                                 ec.message());
      }
    }
    archive_entry_copy_pathname(entry, target.string().c_str());

    if (char const *link{ archive_entry_hardlink(entry) }) {
      archive_entry_copy_hardlink(entry, (root / contained_path(link)).string().c_str());
    }

    if (int const w{ archive_write_header(writer.get(), entry) };
        w != ARCHIVE_OK && w != ARCHIVE_WARN) {
      throw_archive_error("Failed to write entry header", writer.get());
    }

    if (archive_entry_size(entry) > 0) { copy_entry_data(in, writer.get(), buffer); }

    if (archive_write_finish_entry(writer.get()) != ARCHIVE_OK) {
      throw_archive_error("Failed to finish entry", writer.get());
    }

    if (archive_entry_filetype(entry) == AE_IFREG) { ++files; }
  }

  if (files == 0) {
    throw std::runtime_error("Archive extraction failed: no files extracted from " +
                             source_name);
  }
  return files;
}

}  // namespace

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination) {
  auto const reader{ new_reader() };
  if (archive_read_open_filename(reader.get(),
                                 archive_path.string().c_str(),
                                 kReadBlockSize) != ARCHIVE_OK) {
    throw_archive_error("Failed to open archive", reader.get());
  }
  return unpack(reader.get(), destination, archive_path.filename().string());
}

std::uint64_t extract(void const *data,
                      std::size_t length,
                      std::filesystem::path const &destination) {
  auto const reader{ new_reader() };
  if (archive_read_open_memory(reader.get(), data, length) != ARCHIVE_OK) {
    throw_archive_error("Failed to open archive", reader.get());
  }
  return unpack(reader.get(), destination, "downloaded archive");
}

}  // namespace gdenv
