#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace devcfg::fetch {

// Parsed `http://host[:port][/target]`.
struct RemoteEndpoint final {
  std::string host;
  uint16_t port = 80;
  std::string target = "/";

  // Value for the Host header (port omitted when it is the default).
  std::string host_header() const;

  std::string to_string() const;
};

// Throws ConfigError on anything but a well-formed plain-http URL.
RemoteEndpoint parse_endpoint(std::string_view url);

} // namespace devcfg::fetch
