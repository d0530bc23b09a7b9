#include "transport.h"

#include "libcurl_util.h"

#include <stdexcept>
#include <utility>

namespace gdenv {

curl_transport::curl_transport(std::string user_agent)
    : user_agent_{ std::move(user_agent) } {}

http_response curl_transport::get(std::string_view url,
                                  std::vector<std::string> const &headers) {
  auto response{ libcurl_get(url, headers, user_agent_) };
  return http_response{ .status = response.status, .body = std::move(response.body) };
}

std::vector<unsigned char> transport_fetch(byte_transport &transport,
                                           std::string_view url,
                                           std::vector<std::string> const &headers) {
  http_response response{ transport.get(url, headers) };
  if (!response.ok()) {
    throw std::runtime_error("GET " + std::string{ url } + " returned HTTP " +
                             std::to_string(response.status));
  }
  return std::move(response.body);
}

}  // namespace gdenv
