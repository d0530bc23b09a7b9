#include "version.h"

#include "semver.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gdenv {

namespace {

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

// "4.2" -> "4.2.0", "4" -> "4.0.0", "4.2-rc1" -> "4.2.0-rc1". Leaves anything with
// three numeric components alone.
std::string pad_components(std::string_view token) {
  auto const suffix_pos{ token.find_first_of("-+") };
  std::string_view const core{ token.substr(0, suffix_pos) };
  std::string_view const suffix{ suffix_pos == std::string_view::npos
                                     ? std::string_view{}
                                     : token.substr(suffix_pos) };

  std::size_t dots{ 0 };
  for (char const c : core) {
    if (c == '.') { ++dots; }
  }

  std::string padded{ core };
  for (; dots < 2; ++dots) { padded.append(".0"); }
  padded.append(suffix);
  return padded;
}

std::optional<semver::version<>> parse_version(std::string_view token) {
  token = trim(token);
  if (token.empty()) { return std::nullopt; }

  semver::version<> v;
  if (semver::parse(token, v)) { return v; }

  std::string const padded{ pad_components(token) };
  if (semver::parse(std::string_view{ padded }, v)) { return v; }

  return std::nullopt;
}

}  // namespace

std::strong_ordering version_compare(std::string_view a, std::string_view b) {
  auto const va{ parse_version(a) };
  auto const vb{ parse_version(b) };

  if (va && vb) {
    if (*va < *vb) { return std::strong_ordering::less; }
    if (*vb < *va) { return std::strong_ordering::greater; }
    return std::strong_ordering::equal;
  }
  if (va) { return std::strong_ordering::greater; }
  if (vb) { return std::strong_ordering::less; }
  return trim(a).compare(trim(b)) <=> 0;
}

bool version_is_newer(std::string_view candidate, std::string_view current) {
  return version_compare(candidate, current) == std::strong_ordering::greater;
}

}  // namespace gdenv
