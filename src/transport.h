#pragma once

#include "util.h"

#include <string>
#include <string_view>
#include <vector>

namespace gdenv {

struct http_response {
  long status{ 0 };
  std::vector<unsigned char> body;

  bool ok() const { return status >= 200 && status < 300; }
  std::string_view text() const {
    return { reinterpret_cast<char const *>(body.data()), body.size() };
  }
};

// Moves bytes for a URL. Implementations throw std::runtime_error on transport failure
// and return every HTTP status, including errors, as a response.
class byte_transport : unmovable {
 public:
  virtual ~byte_transport() = default;

  virtual http_response get(std::string_view url,
                            std::vector<std::string> const &headers) = 0;
};

class curl_transport : public byte_transport {
 public:
  explicit curl_transport(std::string user_agent);

  http_response get(std::string_view url,
                    std::vector<std::string> const &headers) override;

 private:
  std::string user_agent_;
};

// GET url and require a 2xx status. Throws std::runtime_error naming the URL and status
// otherwise.
std::vector<unsigned char> transport_fetch(byte_transport &transport,
                                           std::string_view url,
                                           std::vector<std::string> const &headers = {});

}  // namespace gdenv
