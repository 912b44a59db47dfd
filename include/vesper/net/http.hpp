#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace vesper::net {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  long status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
};

/// libcurl-backed client. Follows redirects and decodes compressed bodies.
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
};

} // namespace vesper::net
