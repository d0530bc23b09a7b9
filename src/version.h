#pragma once

#include <compare>
#include <string_view>

namespace gdenv {

// Orders engine version tokens ("4.2", "3.5.1", "3.5.1-stable"). Missing minor/patch
// components count as zero. Tokens that do not parse as semver sort before every
// parseable token and among themselves by plain string comparison.
std::strong_ordering version_compare(std::string_view a, std::string_view b);

// True if `candidate` orders strictly after `current` under version_compare.
bool version_is_newer(std::string_view candidate, std::string_view current);

}  // namespace gdenv
