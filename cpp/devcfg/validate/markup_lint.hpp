#pragma once
/*
===============================================================================
Markup Lint (soft diagnostics)
File: markup_lint.hpp
===============================================================================

Checks that catch corrupted exports which still parse:
  - invalid UTF-8 sequences
  - C0 control characters other than TAB/LF/CR (NUL included)
  - U+FFFD replacement characters
  - undefined entity references and bare '&'
  - character references to code points XML does not allow
  - more than one root element, text outside the root
  - unexpected root element name

The XML parser accepts most of these silently (it passes unknown entities
through and stops at NUL), so they are reported here instead.
===============================================================================
*/

#include "devcfg/core/settings.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tinyxml2 {
class XMLDocument;
}

namespace devcfg::validate {

inline constexpr std::size_t kNoOffset = static_cast<std::size_t>(-1);

struct Diagnostic final {
    std::string message;
    int line = 0;                     // 1-based, 0 when unknown
    std::size_t offset = kNoOffset;   // byte offset into the candidate document
};

std::string to_string(const Diagnostic& d);

// Bounded diagnostic list. Garbage exports can trip the same check thousands
// of times; only the first `max` are kept.
class DiagnosticList final {
public:
    explicit DiagnosticList(int max) : max_(max > 0 ? static_cast<std::size_t>(max) : 1) {}

    void add(std::string message, int line = 0, std::size_t offset = kNoOffset);

    const std::vector<Diagnostic>& items() const noexcept { return items_; }
    std::vector<Diagnostic> take() noexcept { return std::move(items_); }
    bool empty() const noexcept { return items_.empty() && dropped_ == 0; }
    std::size_t dropped() const noexcept { return dropped_; }

private:
    std::size_t max_;
    std::size_t dropped_ = 0;
    std::vector<Diagnostic> items_;
};

// Byte-level checks over the raw candidate document.
void lint_bytes(std::string_view doc, DiagnosticList& out);

// Tree-level checks over a successfully parsed document.
void lint_tree(const tinyxml2::XMLDocument& doc, const ValidateSettings& cfg, DiagnosticList& out);

} // namespace devcfg::validate
