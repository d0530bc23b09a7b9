#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace gdenv {

// Unpack an archive (format and compression auto-detected) below destination,
// reproducing directory structure and permission bits. Entries with absolute paths or
// ".." components are refused. Returns the number of regular files written; throws
// std::runtime_error on any failure, including an archive with no files.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination);

std::uint64_t extract(void const *data,
                      std::size_t length,
                      std::filesystem::path const &destination);

}  // namespace gdenv
