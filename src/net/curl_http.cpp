#include "vesper/net/http.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace vesper::net {

namespace {

constexpr long MAX_REDIRECTS = 5;

std::once_flag g_curl_init_once;

struct CurlEasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::size_t write_body(char *data, std::size_t size, std::size_t count, void *user) {
  auto *body = static_cast<std::string *>(user);
  body->append(data, size * count);
  return size * count;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  std::call_once(g_curl_init_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms) {
  HttpResponse response;

  CurlEasy curl(curl_easy_init());
  if (!curl) {
    response.network_error = true;
    response.network_error_message = "failed to initialise libcurl";
    return response;
  }

  CurlHeaderList header_list;
  for (const auto &[name, value] : headers) {
    const std::string line = name + ": " + value;
    curl_slist *appended = curl_slist_append(header_list.get(), line.c_str());
    if (appended == nullptr) {
      response.network_error = true;
      response.network_error_message = "failed to build request headers";
      return response;
    }
    (void)header_list.release();
    header_list.reset(appended);
  }

  char error_buffer[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, MAX_REDIRECTS);
  curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

  const CURLcode code = curl_easy_perform(curl.get());
  if (code == CURLE_OPERATION_TIMEDOUT) {
    response.timeout = true;
    response.network_error = true;
    response.network_error_message = "request timed out";
    return response;
  }
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message =
        error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(code));
    return response;
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace vesper::net
