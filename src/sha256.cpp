#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace gdenv {

namespace {

class sha256_hasher : unmovable {
 public:
  sha256_hasher() {
    mbedtls_sha256_init(&ctx_);
    if (mbedtls_sha256_starts(&ctx_, 0)) {
      mbedtls_sha256_free(&ctx_);
      throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
    }
  }

  ~sha256_hasher() { mbedtls_sha256_free(&ctx_); }

  void update(void const *data, std::size_t length) {
    if (length == 0) { return; }
    if (mbedtls_sha256_update(&ctx_, static_cast<unsigned char const *>(data), length)) {
      throw std::runtime_error("sha256: mbedtls_sha256_update failed");
    }
  }

  sha256_t finish() {
    sha256_t digest{};
    if (mbedtls_sha256_finish(&ctx_, digest.data())) {
      throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
    }
    return digest;
  }

 private:
  mbedtls_sha256_context ctx_;
};

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("sha256: file does not exist: " + file_path.string());
  }

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  sha256_hasher hasher;
  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) { hasher.update(buffer.data(), read_bytes); }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("sha256: fread failed"); }
      break;
    }
  }

  return hasher.finish();
}

sha256_t sha256(void const *data, std::size_t length) {
  sha256_hasher hasher;
  hasher.update(data, length);
  return hasher.finish();
}

void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash) {
  if (expected_hex.size() != 64) {
    throw std::runtime_error(
        "sha256_verify: expected hex string must be 64 characters, got " +
        std::to_string(expected_hex.size()));
  }

  for (char const c : expected_hex) {
    if (util_hex_char_to_int(c) < 0) {
      throw std::runtime_error(std::string("sha256_verify: invalid hex character: ") + c);
    }
  }

  auto const expected_bytes{ util_hex_to_bytes(expected_hex) };
  if (std::memcmp(expected_bytes.data(), actual_hash.data(), actual_hash.size()) != 0) {
    throw std::runtime_error("SHA256 mismatch: expected " + expected_hex + " but got " +
                             util_bytes_to_hex(actual_hash.data(), actual_hash.size()));
  }
}

std::optional<std::string> sha256_from_digest_field(std::string_view digest) {
  constexpr std::string_view kPrefix{ "sha256:" };
  if (!digest.starts_with(kPrefix)) { return std::nullopt; }

  std::string_view const hex{ digest.substr(kPrefix.size()) };
  if (hex.size() != 64) { return std::nullopt; }
  for (char const c : hex) {
    if (util_hex_char_to_int(c) < 0) { return std::nullopt; }
  }
  return std::string{ hex };
}

}  // namespace gdenv
