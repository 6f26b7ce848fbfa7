#pragma once
/*
===============================================================================
Transport Sanitizer
File: transport_sanitizer.hpp
===============================================================================

The device's embedded HTTP server terminates the status line with "\n\r\r",
header lines with "\n\r" and the header block with "\n\r\n". Strict parsers
reject that framing; lenient ones end the header block early and hand the
remaining header lines (Last-Modified, Content-Type) over as body text.

Two independent repairs live here:
  - repair_header_framing(): rewrite the header block of a complete raw
    response into CRLF framing so a strict parser accepts it.
  - sanitize_body(): remove header remnants that reached the body.

Structural validation downstream remains the real defence. Nothing in this
file decides whether a document is acceptable.
===============================================================================
*/

#include "devcfg/core/settings.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace devcfg::sanitize {

// Body begins (after an optional UTF-8 BOM and whitespace) with '<' followed
// by '?', '!' or an XML name-start character.
bool starts_with_markup(std::string_view body) noexcept;

// "HTTP/1.x ..." status line, "Name: value" header line or blank line.
bool is_header_remnant(std::string_view line) noexcept;

// Returns the response with its status line and header lines re-terminated by
// CRLF, or nullopt when no header block terminator can be found or the
// framing is already compliant. Body bytes are copied through verbatim.
std::optional<std::string> repair_header_framing(std::string_view raw);

struct SanitizeResult final {
    std::string document;
    SanitizePolicy policy = SanitizePolicy::kNone;
    int lines_stripped = 0;

    bool changed() const noexcept { return lines_stripped > 0; }
};

SanitizeResult sanitize_body(std::string_view body, const SanitizeSettings& cfg);

} // namespace devcfg::sanitize
