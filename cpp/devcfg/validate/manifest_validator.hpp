#pragma once
/*
===============================================================================
Manifest Validator
File: manifest_validator.hpp
===============================================================================

Purpose:
  - Decide whether a candidate document may become the canonical manifest.

Outcomes:
  - kValid                  parsed, no diagnostics
  - kStructurallyInvalid    hard parse failure (unbalanced tags, truncation,
                            empty document, no root element)
  - kSuspiciousDiagnostics  parsed, but markup lint raised diagnostics

The device firmware is known to emit exports with garbage characters in name
fields and random truncation. A document in the third state parses and is
still wrong, so the pipeline rejects it unless strict_diagnostics is off.
===============================================================================
*/

#include "devcfg/core/settings.hpp"
#include "devcfg/validate/markup_lint.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace devcfg::validate {

enum class ValidationOutcome : int {
    kValid = 0,
    kStructurallyInvalid = 1,
    kSuspiciousDiagnostics = 2
};

const char* to_string(ValidationOutcome o) noexcept;

struct ValidationReport final {
    ValidationOutcome outcome = ValidationOutcome::kValid;
    std::vector<Diagnostic> diagnostics;
    std::size_t dropped_diagnostics = 0;

    std::string root_name;          // empty when parsing failed
    std::size_t element_count = 0;

    bool ok() const noexcept { return outcome == ValidationOutcome::kValid; }

    // One human-readable line per diagnostic (plus a "... N more" line).
    std::vector<std::string> lines() const;
};

ValidationReport validate_manifest(std::string_view doc, const ValidateSettings& cfg);

// Throws ValidationError carrying the report's lines when the outcome is not
// acceptable under `cfg`. Suspicious diagnostics under non-strict settings
// are logged as WARN and accepted.
void require_acceptable(const ValidationReport& report, const ValidateSettings& cfg);

} // namespace devcfg::validate
