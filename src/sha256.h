#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gdenv {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);
sha256_t sha256(void const *data, std::size_t length);

// Verify SHA256 hash matches expected hex string (case-insensitive)
// Throws std::runtime_error with detailed message if mismatch
void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash);

// Hex digest from a release-asset "digest" field ("sha256:<hex>"). Returns nullopt for
// other algorithms or malformed values.
std::optional<std::string> sha256_from_digest_field(std::string_view digest);

}  // namespace gdenv
