#pragma once

#include "vesper/config/schema.hpp"

#include <string>

namespace vesper::net {

/// Route `url` through an institutional proxy.
///
/// `prefix`: prepend proxy.root unless the URL already contains it.
/// `domain`: `https://www.example.org/x` becomes
/// `https://www-example-org.<root>/x`.
/// Disabled proxies, an empty root, unknown types and URLs without a host are
/// returned unchanged.
[[nodiscard]] std::string proxied_url(const std::string &url, const config::ProxyConfig &proxy);

} // namespace vesper::net
