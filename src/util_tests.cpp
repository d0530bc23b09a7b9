#include "util.h"

#include "test_support.h"

#include "doctest.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

TEST_CASE("match dispatches on variant alternative") {
  std::variant<int, std::string> v{ 42 };
  auto const describe{ [](auto const &value) {
    return std::visit(gdenv::match{
                          [](int i) { return "int:" + std::to_string(i); },
                          [](std::string const &s) { return "string:" + s; },
                      },
                      value);
  } };

  CHECK(describe(v) == "int:42");
  v = std::string{ "godot" };
  CHECK(describe(v) == "string:godot");
}

TEST_CASE("match with capturing lambdas and void return") {
  std::variant<int, double> v{ 2.5 };
  int ints{ 0 };
  int doubles{ 0 };
  std::visit(gdenv::match{ [&](int) { ++ints; }, [&](double) { ++doubles; } }, v);
  CHECK(ints == 0);
  CHECK(doubles == 1);
}

TEST_CASE("util_bytes_to_hex produces lowercase pairs") {
  unsigned char const data[]{ 0x00, 0x0f, 0xab, 0xff };
  CHECK(gdenv::util_bytes_to_hex(data, sizeof data) == "000fabff");
  CHECK(gdenv::util_bytes_to_hex(data, 0).empty());
}

TEST_CASE("util_hex_to_bytes accepts either case") {
  CHECK(gdenv::util_hex_to_bytes("ABcd01") ==
        std::vector<unsigned char>{ 0xab, 0xcd, 0x01 });
  CHECK(gdenv::util_hex_to_bytes("").empty());
}

TEST_CASE("util_hex_to_bytes rejects malformed input") {
  CHECK_THROWS_WITH(gdenv::util_hex_to_bytes("abc"), doctest::Contains("even length"));
  CHECK_THROWS_WITH(gdenv::util_hex_to_bytes("zz"), doctest::Contains("position 0"));
  CHECK_THROWS_WITH(gdenv::util_hex_to_bytes("az"), doctest::Contains("position 1"));
}

TEST_CASE("util_hex_char_to_int") {
  CHECK(gdenv::util_hex_char_to_int('0') == 0);
  CHECK(gdenv::util_hex_char_to_int('a') == 10);
  CHECK(gdenv::util_hex_char_to_int('F') == 15);
  CHECK(gdenv::util_hex_char_to_int('g') == -1);
}

TEST_CASE("util_format_bytes") {
  constexpr std::uint64_t kKB{ 1024ull };
  constexpr std::uint64_t kMB{ kKB * 1024ull };
  constexpr std::uint64_t kGB{ kMB * 1024ull };

  CHECK(gdenv::util_format_bytes(0) == "0B");
  CHECK(gdenv::util_format_bytes(1023) == "1023B");
  CHECK(gdenv::util_format_bytes(1536) == "1.50KB");
  CHECK(gdenv::util_format_bytes(60 * kMB) == "60.00MB");
  CHECK(gdenv::util_format_bytes(5 * kGB) == "5.00GB");
}

TEST_CASE("util_write_file creates parent directories") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  auto const path{ tmp.path() / "a" / "b" / "file.bin" };

  gdenv::util_write_file(path, "hello world");
  CHECK(gdenv::test::read_text(path) == "hello world");
}

TEST_CASE("util_write_file truncates existing content") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  auto const path{ tmp.path() / "file.txt" };

  gdenv::util_write_file(path, "a much longer original");
  gdenv::util_write_file(path, "short");
  CHECK(gdenv::test::read_text(path) == "short");
}

TEST_CASE("util_write_file writes empty and binary content") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };

  gdenv::util_write_file(tmp.path() / "empty", std::string_view{});
  CHECK(std::filesystem::file_size(tmp.path() / "empty") == 0);

  unsigned char const bytes[]{ 'a', 0x00, 0xff, 'b' };
  gdenv::util_write_file(tmp.path() / "bin", bytes, sizeof bytes);
  auto const loaded{ gdenv::util_load_file(tmp.path() / "bin") };
  REQUIRE(loaded.size() == sizeof bytes);
  CHECK(std::memcmp(loaded.data(), bytes, sizeof bytes) == 0);
}

TEST_CASE("util_write_file throws when the target is a directory") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  std::filesystem::create_directories(tmp.path() / "dir");
  CHECK_THROWS_AS(gdenv::util_write_file(tmp.path() / "dir", "x"), std::runtime_error);
}

TEST_CASE("util_load_file throws on nonexistent file") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  CHECK_THROWS_WITH(gdenv::util_load_file(tmp.path() / "missing"),
                    doctest::Contains("failed to open file"));
}

TEST_CASE("util_directory_size sums regular files recursively") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  gdenv::util_write_file(tmp.path() / "a.bin", std::string(100, 'a'));
  gdenv::util_write_file(tmp.path() / "sub" / "b.bin", std::string(23, 'b'));

  CHECK(gdenv::util_directory_size(tmp.path()) == 123);
  CHECK(gdenv::util_directory_size(tmp.path() / "a.bin") == 100);
  CHECK(gdenv::util_directory_size(tmp.path() / "missing") == 0);
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  auto const dir{ tmp.path() / "staging" };
  gdenv::util_write_file(dir / "nested" / "file", "x");

  { gdenv::scoped_path_cleanup const cleanup{ dir }; }
  CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("scoped_path_cleanup release keeps the path") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  auto const file{ tmp.path() / "keep.txt" };
  gdenv::util_write_file(file, "x");

  {
    gdenv::scoped_path_cleanup cleanup{ file };
    cleanup.release();
    CHECK(cleanup.path().empty());
  }
  CHECK(std::filesystem::exists(file));
}

TEST_CASE("scoped_path_cleanup reset cleans previous target") {
  gdenv::test::temp_dir const tmp{ "gdenv-util-test" };
  auto const first{ tmp.path() / "first" };
  auto const second{ tmp.path() / "second" };
  gdenv::util_write_file(first, "1");
  gdenv::util_write_file(second, "2");

  {
    gdenv::scoped_path_cleanup cleanup{ first };
    cleanup.reset(second);
    CHECK_FALSE(std::filesystem::exists(first));
    CHECK(std::filesystem::exists(second));
  }
  CHECK_FALSE(std::filesystem::exists(second));
}
