#include "sha256.h"

#include "util.h"

#include "doctest.h"

#include <array>
#include <filesystem>
#include <random>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr gdenv::sha256_t kExpectedSha256Abc{
  0xBA, 0x78, 0x16, 0xBF, 0x8F, 0x01, 0xCF, 0xEA, 0x41, 0x41, 0x40,
  0xDE, 0x5D, 0xAE, 0x22, 0x23, 0xB0, 0x03, 0x61, 0xA3, 0x96, 0x17,
  0x7A, 0x9C, 0xB4, 0x10, 0xFF, 0x61, 0xF2, 0x00, 0x15, 0xAD
};

constexpr char kExpectedHexAbc[]{
  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"
};

struct temp_file_fixture {
  temp_file_fixture() {
    static std::mt19937_64 rng{ std::random_device{}() };
    temp_root = fs::temp_directory_path() / ("gdenv-sha256-test-" + std::to_string(rng()));
    fs::create_directories(temp_root);
  }

  ~temp_file_fixture() {
    std::error_code ec;
    fs::remove_all(temp_root, ec);
  }

  fs::path temp_root;
};

}  // namespace

TEST_CASE_FIXTURE(temp_file_fixture, "sha256 computes known hash of file") {
  fs::path const file{ temp_root / "abc.txt" };
  gdenv::util_write_file(file, "abc");
  CHECK(gdenv::sha256(file) == kExpectedSha256Abc);
}

TEST_CASE("sha256 computes known hash of memory") {
  CHECK(gdenv::sha256("abc", 3) == kExpectedSha256Abc);
}

TEST_CASE_FIXTURE(temp_file_fixture, "sha256 file and memory digests agree") {
  std::string content(3 * 1024 * 1024 + 17, 'x');
  fs::path const file{ temp_root / "big.bin" };
  gdenv::util_write_file(file, content);
  CHECK(gdenv::sha256(file) == gdenv::sha256(content.data(), content.size()));
}

TEST_CASE("sha256 throws for missing file") {
  fs::path const missing{ fs::temp_directory_path() / "gdenv-sha256-does-not-exist.bin" };
  CHECK_FALSE(fs::exists(missing));
  CHECK_THROWS(gdenv::sha256(missing));
}

TEST_CASE("sha256_verify succeeds with correct lowercase hex") {
  CHECK_NOTHROW(gdenv::sha256_verify(kExpectedHexAbc, kExpectedSha256Abc));
}

TEST_CASE("sha256_verify succeeds with correct uppercase hex") {
  std::string const expected_hex =
      "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";
  CHECK_NOTHROW(gdenv::sha256_verify(expected_hex, kExpectedSha256Abc));
}

TEST_CASE("sha256_verify throws on mismatch") {
  std::string const wrong_hex(64, '0');
  CHECK_THROWS_WITH(gdenv::sha256_verify(wrong_hex, kExpectedSha256Abc),
                    ("SHA256 mismatch: expected " + wrong_hex + " but got " +
                     kExpectedHexAbc)
                        .c_str());
}

TEST_CASE("sha256_verify throws on wrong length") {
  CHECK_THROWS_WITH(gdenv::sha256_verify("ba7816bf8f01cfea", kExpectedSha256Abc),
                    "sha256_verify: expected hex string must be 64 characters, got 16");
}

TEST_CASE("sha256_verify throws on invalid hex character") {
  std::string const invalid_hex =
      "ga7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  CHECK_THROWS_WITH(gdenv::sha256_verify(invalid_hex, kExpectedSha256Abc),
                    "sha256_verify: invalid hex character: g");
}

TEST_CASE("sha256_from_digest_field accepts sha256 prefix") {
  auto const hex{ gdenv::sha256_from_digest_field(std::string{ "sha256:" } +
                                                  kExpectedHexAbc) };
  REQUIRE(hex.has_value());
  CHECK(*hex == kExpectedHexAbc);
}

TEST_CASE("sha256_from_digest_field rejects other algorithms and malformed values") {
  CHECK_FALSE(gdenv::sha256_from_digest_field("").has_value());
  CHECK_FALSE(gdenv::sha256_from_digest_field(kExpectedHexAbc).has_value());
  CHECK_FALSE(gdenv::sha256_from_digest_field("sha512:abcd").has_value());
  CHECK_FALSE(gdenv::sha256_from_digest_field("sha256:abcd").has_value());
  CHECK_FALSE(gdenv::sha256_from_digest_field(std::string{ "sha256:" } + std::string(64, 'z'))
                  .has_value());
}
