/*
===============================================================================
Transport Sanitizer
File: transport_sanitizer.cpp
===============================================================================
*/

#include "transport_sanitizer.hpp"

#include <cctype>
#include <vector>

namespace devcfg::sanitize {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool is_ws(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool is_name_start(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == ':' || u >= 0x80;
}

bool is_token_char(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

std::string_view strip_cr(std::string_view s) noexcept {
    while (!s.empty() && s.front() == '\r') s.remove_prefix(1);
    while (!s.empty() && s.back() == '\r') s.remove_suffix(1);
    return s;
}

size_t skip_leading_ws(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && is_ws(s[i])) ++i;
    return i;
}

SanitizeResult passthrough(std::string_view body, SanitizePolicy policy) {
    SanitizeResult r;
    r.document.assign(body.data(), body.size());
    r.policy = policy;
    return r;
}

SanitizeResult strip_structural(std::string_view body) {
    size_t pos = 0;
    int stripped = 0;
    while (pos < body.size()) {
        const size_t nl = body.find('\n', pos);
        const size_t end = (nl == std::string_view::npos) ? body.size() : nl;
        const std::string_view line = body.substr(pos, end - pos);

        if (starts_with_markup(line)) {
            SanitizeResult r;
            r.policy = SanitizePolicy::kStructural;
            r.lines_stripped = stripped;
            const std::string_view doc = body.substr(pos + skip_leading_ws(line));
            r.document.assign(doc.data(), doc.size());
            return r;
        }
        if (!is_header_remnant(line)) break;

        ++stripped;
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    // No markup behind the remnants: hand the body over unchanged and let
    // validation report what is actually there.
    return passthrough(body, SanitizePolicy::kStructural);
}

SanitizeResult strip_fixed(std::string_view body, int n) {
    SanitizeResult r;
    r.policy = SanitizePolicy::kFixedLines;

    size_t pos = 0;
    while (r.lines_stripped < n && pos < body.size()) {
        const size_t nl = body.find('\n', pos);
        ++r.lines_stripped;
        if (nl == std::string_view::npos) {
            pos = body.size();
            break;
        }
        pos = nl + 1;
    }
    const std::string_view doc = body.substr(pos);
    r.document.assign(doc.data(), doc.size());
    return r;
}

} // namespace

bool starts_with_markup(std::string_view body) noexcept {
    if (body.substr(0, kUtf8Bom.size()) == kUtf8Bom) body.remove_prefix(kUtf8Bom.size());
    const size_t i = skip_leading_ws(body);
    if (i + 1 >= body.size() || body[i] != '<') return false;
    const char c = body[i + 1];
    return c == '?' || c == '!' || is_name_start(c);
}

bool is_header_remnant(std::string_view line) noexcept {
    line = strip_cr(line);
    if (line.empty()) return true;
    if (line.substr(0, 5) == "HTTP/") return true;

    size_t i = 0;
    while (i < line.size() && is_token_char(line[i])) ++i;
    return i > 0 && i < line.size() && line[i] == ':';
}

std::optional<std::string> repair_header_framing(std::string_view raw) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    size_t body_pos = std::string_view::npos;

    while (pos < raw.size()) {
        const size_t nl = raw.find('\n', pos);
        if (nl == std::string_view::npos) break;

        const std::string_view piece = strip_cr(raw.substr(pos, nl - pos));
        if (piece.empty()) {
            if (!lines.empty()) {
                body_pos = nl + 1;
                break;
            }
        } else if (piece.front() == '<' && !lines.empty()) {
            // "\n\r" directly followed by the document: no blank separator.
            body_pos = pos + (raw.substr(pos, nl - pos).find('<'));
            break;
        } else {
            lines.push_back(piece);
        }
        pos = nl + 1;
    }

    if (body_pos == std::string_view::npos || lines.empty()) return std::nullopt;
    if (lines.front().substr(0, 5) != "HTTP/") return std::nullopt;

    std::string out;
    out.reserve(raw.size() + 2 * lines.size() + 2);
    for (const auto& l : lines) {
        out.append(l.data(), l.size());
        out.append("\r\n");
    }
    out.append("\r\n");
    out.append(raw.data() + body_pos, raw.size() - body_pos);

    if (out == raw) return std::nullopt;
    return out;
}

SanitizeResult sanitize_body(std::string_view body, const SanitizeSettings& cfg) {
    switch (cfg.policy) {
        case SanitizePolicy::kNone:
            return passthrough(body, SanitizePolicy::kNone);
        case SanitizePolicy::kStructural:
            if (starts_with_markup(body)) return passthrough(body, SanitizePolicy::kStructural);
            return strip_structural(body);
        case SanitizePolicy::kFixedLines:
            if (starts_with_markup(body)) return passthrough(body, SanitizePolicy::kFixedLines);
            return strip_fixed(body, cfg.trim_lines);
    }
    return passthrough(body, cfg.policy);
}

} // namespace devcfg::sanitize
