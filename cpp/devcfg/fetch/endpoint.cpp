#include "devcfg/fetch/endpoint.hpp"

#include "devcfg/core/errors.hpp"

#include <cctype>

namespace devcfg::fetch {

namespace {

constexpr std::string_view kScheme = "http://";

bool iequals_prefix(std::string_view s, std::string_view prefix) {
  if (s.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
  }
  return true;
}

bool valid_host_char(char c) {
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '-' || c == '.' || c == '_';
}

} // namespace

std::string RemoteEndpoint::host_header() const {
  if (port == 80) return host;
  return host + ":" + std::to_string(port);
}

std::string RemoteEndpoint::to_string() const {
  return "http://" + host_header() + target;
}

RemoteEndpoint parse_endpoint(std::string_view url) {
  if (!iequals_prefix(url, kScheme)) {
    if (url.find("://") != std::string_view::npos) {
      throw ConfigError("unsupported URL scheme (only http:// is supported): " + std::string(url));
    }
    throw ConfigError("endpoint URL must start with http:// : " + std::string(url));
  }

  std::string_view rest = url.substr(kScheme.size());
  const size_t slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  RemoteEndpoint ep;
  if (slash != std::string_view::npos) ep.target = std::string(rest.substr(slash));

  if (authority.find('@') != std::string_view::npos) {
    throw ConfigError("credentials in endpoint URL are not supported: " + std::string(url));
  }

  const size_t colon = authority.rfind(':');
  std::string_view host = authority.substr(0, colon);
  if (colon != std::string_view::npos) {
    std::string_view port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5) {
      throw ConfigError("invalid port in endpoint URL: " + std::string(url));
    }
    unsigned long p = 0;
    for (char c : port) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        throw ConfigError("invalid port in endpoint URL: " + std::string(url));
      }
      p = p * 10 + static_cast<unsigned long>(c - '0');
    }
    if (p == 0 || p > 65535) {
      throw ConfigError("port out of range in endpoint URL: " + std::string(url));
    }
    ep.port = static_cast<uint16_t>(p);
  }

  if (host.empty()) {
    throw ConfigError("missing host in endpoint URL: " + std::string(url));
  }
  for (char c : host) {
    if (!valid_host_char(c)) {
      throw ConfigError("invalid character in endpoint host: " + std::string(url));
    }
  }
  ep.host = std::string(host);

  // Fragments are never sent on the wire.
  const size_t hash = ep.target.find('#');
  if (hash != std::string::npos) ep.target.erase(hash);
  if (ep.target.empty()) ep.target = "/";

  return ep;
}

} // namespace devcfg::fetch
