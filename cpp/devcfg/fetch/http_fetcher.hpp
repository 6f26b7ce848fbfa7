#pragma once
/*
===============================================================================
HTTP Fetcher
File: http_fetcher.hpp
===============================================================================

Purpose:
  - One blocking GET against the device's export endpoint.
  - Whole exchange bounded by FetchSettings::timeout_ms.

Contract:
  - Single attempt. Any failure throws TransportError and nothing is written.
  - Non-2xx status is a failure.
  - The read ends at the framed end of the message (Content-Length) or
    when the device closes, whichever the response defines. A response of
    up to max_bytes bytes on the wire is accepted.
  - Responses with non-compliant header framing are repaired once via
    sanitize::repair_header_framing() before giving up.
===============================================================================
*/

#include "devcfg/core/settings.hpp"
#include "devcfg/fetch/endpoint.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devcfg::fetch {

struct ParsedResponse final {
    unsigned status = 0;
    std::string reason;
    std::string body;
};

struct FetchResult final {
    RemoteEndpoint endpoint;
    unsigned status = 0;
    std::string reason;
    std::string body;
    std::size_t bytes_received = 0;   // raw bytes on the wire
    bool header_repaired = false;     // framing had to be rewritten
};

// Parse a complete HTTP/1.x response held in memory (server closed the
// connection after it). Returns nullopt and fills `err` on malformed framing
// or truncated bodies.
std::optional<ParsedResponse> parse_response(std::string_view raw,
                                             std::uint64_t body_limit,
                                             std::string* err);

FetchResult fetch_manifest(const RemoteEndpoint& ep, const FetchSettings& cfg);

} // namespace devcfg::fetch
