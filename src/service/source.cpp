#include "vesper/service/source.hpp"

#include "vesper/common/fs.hpp"

namespace vesper::service {

HttpOfficeSource::HttpOfficeSource(std::shared_ptr<net::HttpClient> http, std::string url,
                                   const std::uint64_t timeout_ms, std::string user_agent)
    : http_(std::move(http)), url_(std::move(url)), timeout_ms_(timeout_ms),
      user_agent_(std::move(user_agent)) {}

common::Result<std::string> HttpOfficeSource::fetch() {
  if (http_ == nullptr) {
    return common::Result<std::string>::failure("no HTTP client configured");
  }

  const net::HttpHeaders headers = {
      {"Accept", "text/html,application/xhtml+xml"},
      {"User-Agent", user_agent_},
  };
  auto response = http_->get(url_, headers, timeout_ms_);

  if (response.timeout) {
    return common::Result<std::string>::failure("request timed out");
  }
  if (response.network_error) {
    return common::Result<std::string>::failure(response.network_error_message.empty()
                                                    ? "network error"
                                                    : response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<std::string>::failure("request failed with status " +
                                                std::to_string(response.status));
  }
  return common::Result<std::string>::success(std::move(response.body));
}

FileOfficeSource::FileOfficeSource(std::filesystem::path path) : path_(std::move(path)) {}

common::Result<std::string> FileOfficeSource::fetch() { return common::read_file(path_); }

} // namespace vesper::service
