#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gdenv {

struct libcurl_response {
  long status{ 0 };
  std::vector<unsigned char> body;
};

void libcurl_ensure_initialized();

// GET url into memory, following redirects. Any HTTP status is returned to the caller;
// only transport-level failures (DNS, TLS, connection, write) throw std::runtime_error.
libcurl_response libcurl_get(std::string_view url,
                             std::vector<std::string> const &headers,
                             std::string_view user_agent);

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string libcurl_escape(std::string_view component);

std::string libcurl_version();

}  // namespace gdenv
