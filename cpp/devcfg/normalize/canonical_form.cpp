#include "canonical_form.hpp"

#include "devcfg/core/errors.hpp"

#include <tinyxml2.h>

namespace devcfg::normalize {

namespace {

// XMLPrinter with a configurable indent unit (the stock printer uses four
// spaces per level).
class IndentPrinter final : public tinyxml2::XMLPrinter {
public:
    explicit IndentPrinter(int width) : tinyxml2::XMLPrinter(nullptr, false), width_(width) {}

protected:
    void PrintSpace(int depth) override {
        for (int i = 0; i < depth * width_; ++i) Putc(' ');
    }

private:
    int width_;
};

} // namespace

std::string canonicalize(std::string_view text, const NormalizeSettings& cfg) {
    cfg.validate_or_throw();

    tinyxml2::XMLDocument doc(true, tinyxml2::PRESERVE_WHITESPACE);
    if (doc.Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
        const char* msg = doc.ErrorStr();
        throw ValidationError("cannot canonicalize malformed document", true,
                              {msg ? std::string(msg) : std::string("parse error")});
    }

    IndentPrinter printer(cfg.indent_width);
    doc.Print(&printer);

    // CStrSize() counts the terminating NUL.
    std::string out(printer.CStr(), printer.CStrSize() > 0 ? printer.CStrSize() - 1 : 0);
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ' || out.back() == '\r')) {
        out.pop_back();
    }
    out.push_back('\n');
    return out;
}

} // namespace devcfg::normalize
