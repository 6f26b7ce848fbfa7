#pragma once
/*
===============================================================================
Canonical Form
File: canonical_form.hpp
===============================================================================

Canonical manifest layout, the on-disk contract the controller reads:
  - one element per line, `indent_width` spaces per nesting level
  - LF line endings, exactly one trailing newline
  - attribute order and quoting as parsed; entities re-escaped
  - text-only elements stay on one line

canonicalize(canonicalize(d)) == canonicalize(d), byte for byte.
===============================================================================
*/

#include "devcfg/core/settings.hpp"

#include <string>
#include <string_view>

namespace devcfg::normalize {

// Throws ValidationError if `doc` does not parse; callers run the validator
// first, so that only happens on misuse.
std::string canonicalize(std::string_view doc, const NormalizeSettings& cfg);

} // namespace devcfg::normalize
