/*
===============================================================================
Markup Lint (soft diagnostics)
File: markup_lint.cpp
===============================================================================
*/

#include "markup_lint.hpp"

#include <tinyxml2.h>
#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>

namespace devcfg::validate {

namespace {

// Maps byte offsets to 1-based line numbers.
class LineIndex final {
public:
    explicit LineIndex(std::string_view s) {
        starts_.push_back(0);
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts_.push_back(i + 1);
        }
    }

    int line_of(std::size_t offset) const {
        const auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
        return static_cast<int>(it - starts_.begin());
    }

private:
    std::vector<std::size_t> starts_;
};

std::string hex_byte(unsigned char c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(c));
    return buf;
}

bool is_name_start(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == ':' || c >= 0x80;
}

bool is_name_char(unsigned char c) {
    return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
}

// XML 1.0 Char production.
bool xml_char_allowed(std::uint32_t cp) {
    return cp == 0x9 || cp == 0xA || cp == 0xD ||
           (cp >= 0x20 && cp <= 0xD7FF) ||
           (cp >= 0xE000 && cp <= 0xFFFD) ||
           (cp >= 0x10000 && cp <= 0x10FFFF);
}

bool is_predefined_entity(std::string_view name) {
    return name == "amp" || name == "lt" || name == "gt" || name == "quot" || name == "apos";
}

// Inspect the reference starting at doc[i] == '&'. Returns bytes consumed and
// sets `problem` when the reference is not one the parser expands.
std::size_t check_reference(std::string_view doc, std::size_t i, std::string* problem) {
    const std::size_t n = doc.size();
    std::size_t j = i + 1;

    if (j < n && doc[j] == '#') {
        ++j;
        const bool hex = (j < n && doc[j] == 'x');
        if (hex) ++j;
        const std::size_t digits_start = j;
        std::uint32_t cp = 0;
        bool overflow = false;
        while (j < n) {
            const auto c = static_cast<unsigned char>(doc[j]);
            int d = -1;
            if (std::isdigit(c)) d = c - '0';
            else if (hex && std::isxdigit(c)) d = std::tolower(c) - 'a' + 10;
            if (d < 0) break;
            if (!overflow) {
                cp = cp * (hex ? 16u : 10u) + static_cast<std::uint32_t>(d);
                if (cp > 0x10FFFF) overflow = true;
            }
            ++j;
        }
        if (j == digits_start || j >= n || doc[j] != ';') {
            *problem = "malformed character reference";
            return j - i;
        }
        if (overflow || !xml_char_allowed(cp)) {
            *problem = "character reference to a code point XML does not allow";
        }
        return j + 1 - i;
    }

    if (j < n && is_name_start(static_cast<unsigned char>(doc[j]))) {
        while (j < n && is_name_char(static_cast<unsigned char>(doc[j]))) ++j;
        if (j < n && doc[j] == ';') {
            const std::string_view name = doc.substr(i + 1, j - i - 1);
            if (!is_predefined_entity(name)) {
                *problem = "undefined entity '&" + std::string(name) + ";'";
            }
            return j + 1 - i;
        }
    }

    *problem = "bare '&' outside an entity reference";
    return 1;
}

// Returns the offset just past the DOCTYPE declaration starting at i.
std::size_t skip_doctype(std::string_view doc, std::size_t i) {
    int depth = 0;
    for (std::size_t j = i; j < doc.size(); ++j) {
        if (doc[j] == '[') ++depth;
        else if (doc[j] == ']' && depth > 0) --depth;
        else if (doc[j] == '>' && depth == 0) return j + 1;
    }
    return doc.size();
}

void lint_encoding(std::string_view doc, const LineIndex& lines, DiagnosticList& out) {
    const char* const begin = doc.data();
    const char* const end = begin + doc.size();
    for (const char* it = begin; it != end;) {
        const char* bad = utf8::find_invalid(it, end);
        if (bad == end) break;
        const auto off = static_cast<std::size_t>(bad - begin);
        out.add("invalid UTF-8 byte " + hex_byte(static_cast<unsigned char>(*bad)), lines.line_of(off), off);
        it = bad + 1;
    }
}

void lint_characters(std::string_view doc, const LineIndex& lines, DiagnosticList& out) {
    for (std::size_t i = 0; i < doc.size(); ++i) {
        const auto c = static_cast<unsigned char>(doc[i]);
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
            out.add("control character " + hex_byte(c), lines.line_of(i), i);
        } else if (c == 0xEF && i + 2 < doc.size() &&
                   static_cast<unsigned char>(doc[i + 1]) == 0xBF &&
                   static_cast<unsigned char>(doc[i + 2]) == 0xBD) {
            out.add("U+FFFD replacement character", lines.line_of(i), i);
            i += 2;
        }
    }
}

void lint_references(std::string_view doc, const LineIndex& lines, DiagnosticList& out) {
    std::size_t i = 0;
    while (i < doc.size()) {
        if (doc[i] == '<') {
            std::size_t e = std::string_view::npos;
            if (doc.compare(i, 4, "<!--") == 0) {
                e = doc.find("-->", i + 4);
                if (e == std::string_view::npos) return;
                i = e + 3;
            } else if (doc.compare(i, 9, "<![CDATA[") == 0) {
                e = doc.find("]]>", i + 9);
                if (e == std::string_view::npos) return;
                i = e + 3;
            } else if (doc.compare(i, 2, "<?") == 0) {
                e = doc.find("?>", i + 2);
                if (e == std::string_view::npos) return;
                i = e + 2;
            } else if (doc.compare(i, 9, "<!DOCTYPE") == 0) {
                i = skip_doctype(doc, i);
            } else {
                ++i;
            }
            continue;
        }
        if (doc[i] == '&') {
            std::string problem;
            const std::size_t len = check_reference(doc, i, &problem);
            if (!problem.empty()) out.add(problem, lines.line_of(i), i);
            i += std::max<std::size_t>(len, 1);
            continue;
        }
        ++i;
    }
}

bool is_blank(const char* s) {
    if (!s) return true;
    for (; *s; ++s) {
        if (!std::isspace(static_cast<unsigned char>(*s))) return false;
    }
    return true;
}

} // namespace

std::string to_string(const Diagnostic& d) {
    std::string s;
    if (d.line > 0) s += "line " + std::to_string(d.line) + ": ";
    s += d.message;
    if (d.offset != kNoOffset) s += " (byte " + std::to_string(d.offset) + ")";
    return s;
}

void DiagnosticList::add(std::string message, int line, std::size_t offset) {
    if (items_.size() >= max_) {
        ++dropped_;
        return;
    }
    items_.push_back(Diagnostic{std::move(message), line, offset});
}

void lint_bytes(std::string_view doc, DiagnosticList& out) {
    const LineIndex lines(doc);
    lint_encoding(doc, lines, out);
    lint_characters(doc, lines, out);
    lint_references(doc, lines, out);
}

void lint_tree(const tinyxml2::XMLDocument& doc, const ValidateSettings& cfg, DiagnosticList& out) {
    int roots = 0;
    const tinyxml2::XMLElement* root = nullptr;

    for (const tinyxml2::XMLNode* node = doc.FirstChild(); node; node = node->NextSibling()) {
        if (const auto* el = node->ToElement()) {
            ++roots;
            if (!root) root = el;
            else out.add("additional root element <" + std::string(el->Name()) + ">", el->GetLineNum());
        } else if (const auto* text = node->ToText()) {
            if (!is_blank(text->Value())) {
                out.add("text outside the root element", text->GetLineNum());
            }
        }
    }

    if (roots > 1) {
        out.add(std::to_string(roots) + " root elements, expected exactly one");
    }
    if (root && !cfg.expected_root.empty() && cfg.expected_root != root->Name()) {
        out.add("root element is <" + std::string(root->Name()) + ">, expected <" +
                    cfg.expected_root + ">",
                root->GetLineNum());
    }
}

} // namespace devcfg::validate
