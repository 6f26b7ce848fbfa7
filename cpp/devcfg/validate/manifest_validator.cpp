/*
===============================================================================
Manifest Validator
File: manifest_validator.cpp
===============================================================================
*/

#include "manifest_validator.hpp"

#include "devcfg/core/errors.hpp"
#include "devcfg/core/logging.hpp"

#include <tinyxml2.h>

namespace devcfg::validate {

namespace {

constexpr const char* kOperatorAdvice =
    "the device returned a corrupt configuration export; inspect the raw artifact "
    "and reboot the device if the problem persists. The previous canonical manifest "
    "was left untouched";

class ElementCounter final : public tinyxml2::XMLVisitor {
public:
    bool VisitEnter(const tinyxml2::XMLElement&, const tinyxml2::XMLAttribute*) override {
        ++count;
        return true;
    }

    std::size_t count = 0;
};

} // namespace

const char* to_string(ValidationOutcome o) noexcept {
    switch (o) {
        case ValidationOutcome::kValid:                 return "valid";
        case ValidationOutcome::kStructurallyInvalid:   return "structurally-invalid";
        case ValidationOutcome::kSuspiciousDiagnostics: return "suspicious-diagnostics";
        default:                                        return "unknown";
    }
}

std::vector<std::string> ValidationReport::lines() const {
    std::vector<std::string> out;
    out.reserve(diagnostics.size() + 1);
    for (const auto& d : diagnostics) out.push_back(to_string(d));
    if (dropped_diagnostics > 0) {
        out.push_back("... " + std::to_string(dropped_diagnostics) + " more diagnostics suppressed");
    }
    return out;
}

ValidationReport validate_manifest(std::string_view text, const ValidateSettings& cfg) {
    cfg.validate_or_throw();

    ValidationReport rep;
    DiagnosticList hard(cfg.max_diagnostics);
    DiagnosticList soft(cfg.max_diagnostics);

    tinyxml2::XMLDocument doc(true, tinyxml2::PRESERVE_WHITESPACE);
    const tinyxml2::XMLError err = doc.Parse(text.data(), text.size());

    if (err != tinyxml2::XML_SUCCESS) {
        const char* msg = doc.ErrorStr();
        hard.add(msg && *msg ? std::string(msg) : std::string(tinyxml2::XMLDocument::ErrorIDToName(err)),
                 doc.ErrorLineNum());
    } else if (!doc.RootElement()) {
        hard.add("document has no root element");
    }

    // Byte-level findings are reported in both cases: they usually explain a
    // hard failure (NUL in the middle of the export, for instance).
    lint_bytes(text, soft);

    if (hard.empty()) {
        lint_tree(doc, cfg, soft);

        ElementCounter counter;
        doc.Accept(&counter);
        rep.element_count = counter.count;
        rep.root_name = doc.RootElement()->Name();
    }

    rep.outcome = !hard.empty() ? ValidationOutcome::kStructurallyInvalid
                : !soft.empty() ? ValidationOutcome::kSuspiciousDiagnostics
                                : ValidationOutcome::kValid;

    rep.dropped_diagnostics = hard.dropped() + soft.dropped();
    rep.diagnostics = hard.take();
    for (auto& d : soft.take()) rep.diagnostics.push_back(std::move(d));
    return rep;
}

void require_acceptable(const ValidationReport& report, const ValidateSettings& cfg) {
    switch (report.outcome) {
        case ValidationOutcome::kValid:
            return;

        case ValidationOutcome::kSuspiciousDiagnostics:
            if (!cfg.strict_diagnostics) {
                for (const auto& line : report.lines()) log_warn("validate: " + line);
                log_warn("validate: accepting document with diagnostics (strict_diagnostics=0)");
                return;
            }
            throw ValidationError(std::string("manifest parsed but raised diagnostics: ") + kOperatorAdvice,
                                  false, report.lines());

        case ValidationOutcome::kStructurallyInvalid:
            throw ValidationError(std::string("manifest is not well-formed XML: ") + kOperatorAdvice,
                                  true, report.lines());
    }
    throw ValidationError("unknown validation outcome", true, report.lines());
}

} // namespace devcfg::validate
