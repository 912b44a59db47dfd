#include "vesper/net/proxy.hpp"

#include "vesper/common/strings.hpp"

#include <algorithm>
#include <cctype>

namespace vesper::net {

namespace {

bool is_scheme_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '.' || c == '-';
}

// scheme://[userinfo@]host[:port][/path?query#fragment]
std::string replace_host(const std::string &url, const std::string &root) {
  const std::size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0 ||
      std::isalpha(static_cast<unsigned char>(url.front())) == 0 ||
      !std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(scheme_end),
                   is_scheme_char)) {
    return url;
  }

  std::size_t host_begin = scheme_end + 3;
  const std::size_t authority_end = url.find_first_of("/?#", host_begin);
  const std::size_t at = url.find('@', host_begin);
  if (at != std::string::npos && at < authority_end) {
    host_begin = at + 1;
  }
  const std::size_t host_end = std::min(url.find_first_of("/?#:", host_begin), url.size());
  if (host_end == host_begin) {
    return url;
  }

  std::string host = url.substr(host_begin, host_end - host_begin);
  std::replace(host.begin(), host.end(), '.', '-');
  return url.substr(0, host_begin) + host + "." + root + url.substr(host_end);
}

} // namespace

std::string proxied_url(const std::string &url, const config::ProxyConfig &proxy) {
  if (!proxy.enabled || proxy.root.empty()) {
    return url;
  }

  const std::string type = common::to_lower(common::trim(proxy.type));
  if (type == "prefix") {
    if (url.find(proxy.root) != std::string::npos) {
      return url;
    }
    return proxy.root + url;
  }
  if (type == "domain") {
    return replace_host(url, proxy.root);
  }
  return url;
}

} // namespace vesper::net
