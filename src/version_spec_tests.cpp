#include "version_spec.h"

#include "doctest.h"

#include <stdexcept>
#include <string>

namespace gdenv {

TEST_CASE("version_spec: canonical appends stable channel") {
  auto const spec{ version_spec::from("3.5.1") };
  CHECK(spec.requested() == "3.5.1");
  CHECK(spec.canonical() == "3.5.1-stable");
}

TEST_CASE("version_spec: canonical is deterministic") {
  CHECK(version_spec::from("4.2") == version_spec::from("4.2"));
  CHECK(version_spec::from("4.2").canonical() == version_spec::from("4.2").canonical());
  CHECK_FALSE(version_spec::from("4.2") == version_spec::from("4.2.1"));
}

TEST_CASE("version_spec: arbitrary tokens are accepted verbatim") {
  CHECK(version_spec::from("4.3-rc1").canonical() == "4.3-rc1-stable");
  CHECK(version_spec::from("v4").canonical() == "v4-stable");
}

TEST_CASE("version_spec: rejects tokens that are not safe path components") {
  CHECK_THROWS_AS(version_spec::from(""), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("."), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from(".."), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("../etc"), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("3.5..1"), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("3/5"), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("3\\5"), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("C:3"), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("3*"), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from("3\n"), std::invalid_argument);
  CHECK_THROWS_AS(version_spec::from(std::string_view{ "3\0x", 3 }), std::invalid_argument);
}

TEST_CASE("version_spec: error message names the token") {
  try {
    version_spec::from("a/b");
    FAIL("expected invalid_argument");
  } catch (std::invalid_argument const &e) {
    CHECK(std::string{ e.what() }.find("'a/b'") != std::string::npos);
  }
}

TEST_CASE("version_spec_requested_from_canonical") {
  CHECK(version_spec_requested_from_canonical("3.5.1-stable") == "3.5.1");
  CHECK(version_spec_requested_from_canonical("3.5.1").empty());
  CHECK(version_spec_requested_from_canonical("-stable").empty());
}

}  // namespace gdenv
