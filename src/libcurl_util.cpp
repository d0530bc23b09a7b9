#include "libcurl_util.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace gdenv {

namespace {

size_t curl_write_memory(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body{ static_cast<std::vector<unsigned char> *>(userdata) };
  size_t const total{ size * nmemb };
  body->insert(body->end(),
               reinterpret_cast<unsigned char const *>(ptr),
               reinterpret_cast<unsigned char const *>(ptr) + total);
  return total;
}

struct curl_slist_deleter {
  void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
};

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

libcurl_response libcurl_get(std::string_view url,
                             std::vector<std::string> const &headers,
                             std::string_view user_agent) {
  libcurl_ensure_initialized();

  if (url.empty()) { throw std::invalid_argument("libcurl_get: url is empty"); }

  std::string const url_copy{ url };
  std::string const user_agent_copy{ user_agent };

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  std::unique_ptr<curl_slist, curl_slist_deleter> header_list;
  for (auto const &header : headers) {
    curl_slist *const appended{ curl_slist_append(header_list.get(), header.c_str()) };
    if (!appended) { throw std::runtime_error("curl_slist_append failed"); }
    static_cast<void>(header_list.release());
    header_list.reset(appended);
  }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  libcurl_response response;

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, user_agent_copy.c_str());
  setopt(CURLOPT_WRITEFUNCTION, curl_write_memory);
  setopt(CURLOPT_WRITEDATA, &response.body);
  setopt(CURLOPT_NOPROGRESS, 1L);
  if (header_list) { setopt(CURLOPT_HTTPHEADER, header_list.get()); }

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    throw std::runtime_error("GET " + url_copy + " failed: " +
                             curl_easy_strerror(perform_result));
  }

  CURLcode const info_result{
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status)
  };
  if (info_result != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_getinfo failed: ") +
                             curl_easy_strerror(info_result));
  }

  return response;
}

std::string libcurl_escape(std::string_view component) {
  libcurl_ensure_initialized();

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  std::unique_ptr<char, decltype(&curl_free)> escaped{
    curl_easy_escape(handle.get(), component.data(), static_cast<int>(component.size())),
    &curl_free
  };
  if (!escaped) { throw std::runtime_error("curl_easy_escape failed"); }
  return escaped.get();
}

std::string libcurl_version() { return curl_version_info(CURLVERSION_NOW)->version; }

}  // namespace gdenv
