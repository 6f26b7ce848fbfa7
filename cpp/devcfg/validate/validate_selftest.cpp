/*
  Manifest Validation + Canonical Form Selftest

  Checks:
    1) Well-formed exports are valid; root name and element count reported.
    2) Hard failures (unbalanced, truncated, empty, NUL mid-document) are
       structurally invalid.
    3) Documents that parse but carry corruption (control characters,
       undefined entities, bad UTF-8, replacement characters, wrong root)
       raise diagnostics.
    4) require_acceptable() honours strict_diagnostics and never accepts a
       structural failure.
    5) canonicalize() produces the documented layout and is idempotent.

  Framework-free; non-zero exit code indicates failure.
*/

#include <string>
#include <vector>

#include "devcfg/core/errors.hpp"
#include "devcfg/core/settings.hpp"
#include "devcfg/normalize/canonical_form.hpp"
#include "devcfg/validate/manifest_validator.hpp"
#include "devcfg/testing/selftest.hpp"

namespace devcfg {
namespace {

using namespace selftest;
using validate::ValidationOutcome;
using validate::validate_manifest;

const std::string kLamp = "<config><device name=\"Lamp\"/></config>";

bool any_diagnostic(const validate::ValidationReport& r, std::string_view needle) {
  for (const auto& d : r.diagnostics) {
    if (contains(d.message, needle)) return true;
  }
  return false;
}

void expect_outcome(const validate::ValidationReport& r, ValidationOutcome want, std::string_view msg) {
  if (r.outcome != want) {
    fail(msg);
    std::cerr << "  got " << validate::to_string(r.outcome) << ", want " << validate::to_string(want) << "\n";
    for (const auto& l : r.lines()) std::cerr << "    " << l << "\n";
  } else {
    pass(msg);
  }
}

void test_valid_documents() {
  const ValidateSettings cfg;

  const auto r = validate_manifest(kLamp, cfg);
  expect_outcome(r, ValidationOutcome::kValid, "lamp export is valid");
  expect_eq_str(r.root_name, "config", "root name reported");
  expect_eq<std::size_t>(r.element_count, 2, "element count");
  expect_true(r.diagnostics.empty(), "no diagnostics");

  const auto r2 = validate_manifest(
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<!-- exported AT&T style -->\n"
      "<Project><Areas><Area Name=\"Kitchen &amp; Dining\" IntegrationID=\"1\">&#233;</Area></Areas></Project>\n",
      cfg);
  expect_outcome(r2, ValidationOutcome::kValid, "declaration, comment and references are valid");
  expect_eq<std::size_t>(r2.element_count, 3, "nested element count");
}

void test_structural_failures() {
  const ValidateSettings cfg;

  const auto unbalanced = validate_manifest("<config><device></config>", cfg);
  expect_outcome(unbalanced, ValidationOutcome::kStructurallyInvalid, "unbalanced tags rejected");
  expect_true(!unbalanced.diagnostics.empty(), "unbalanced tags explained");
  expect_true(unbalanced.root_name.empty(), "no root name for a failed parse");

  expect_outcome(validate_manifest("<config><device name=\"La", cfg),
                 ValidationOutcome::kStructurallyInvalid, "truncated mid-tag rejected");
  expect_outcome(validate_manifest("<config><device name=\"Lamp\"/>", cfg),
                 ValidationOutcome::kStructurallyInvalid, "missing closing tag rejected");
  expect_outcome(validate_manifest("", cfg), ValidationOutcome::kStructurallyInvalid,
                 "empty document rejected");
  expect_outcome(validate_manifest("  \r\n ", cfg), ValidationOutcome::kStructurallyInvalid,
                 "whitespace-only document rejected");

  const std::string with_nul = std::string("<config><device name=\"La") + '\0' + "mp\"/></config>";
  const auto nul = validate_manifest(with_nul, cfg);
  expect_outcome(nul, ValidationOutcome::kStructurallyInvalid, "NUL inside the export rejected");
  expect_true(any_diagnostic(nul, "control character 0x00"), "NUL reported as a control character");
}

void test_soft_diagnostics() {
  const ValidateSettings cfg;

  const auto ctl = validate_manifest("<config><device name=\"La\x01mp\"/></config>", cfg);
  expect_outcome(ctl, ValidationOutcome::kSuspiciousDiagnostics, "control character in a name flagged");
  expect_true(any_diagnostic(ctl, "control character 0x01"), "control character named");
  expect_eq_str(ctl.root_name, "config", "root still reported for a parsed document");

  const auto ent = validate_manifest("<a>&foo;</a>", cfg);
  expect_true(!ent.ok(), "undefined entity not accepted");
  expect_true(any_diagnostic(ent, "undefined entity '&foo;'"), "undefined entity named");

  const auto amp = validate_manifest("<a>AT&T</a>", cfg);
  expect_true(!amp.ok(), "bare ampersand not accepted");
  expect_true(any_diagnostic(amp, "bare '&'"), "bare ampersand named");

  const auto cref = validate_manifest("<a>&#1;</a>", cfg);
  expect_true(any_diagnostic(cref, "code point XML does not allow"), "disallowed character reference named");

  const auto utf = validate_manifest("<a>caf\xC3\x28</a>", cfg);
  expect_outcome(utf, ValidationOutcome::kSuspiciousDiagnostics, "invalid UTF-8 flagged");
  expect_true(any_diagnostic(utf, "invalid UTF-8 byte 0xC3"), "invalid UTF-8 byte named");

  const auto fffd = validate_manifest("<a>Lamp \xEF\xBF\xBD</a>", cfg);
  expect_outcome(fffd, ValidationOutcome::kSuspiciousDiagnostics, "replacement character flagged");

  expect_true(!validate_manifest("<a/><b/>", cfg).ok(), "two root elements not accepted");
  expect_true(!validate_manifest("<a/>trailing text", cfg).ok(), "text after the root not accepted");

  ValidateSettings rooted;
  rooted.expected_root = "Project";
  const auto wrong = validate_manifest(kLamp, rooted);
  expect_outcome(wrong, ValidationOutcome::kSuspiciousDiagnostics, "unexpected root flagged");
  expect_true(any_diagnostic(wrong, "root element is <config>, expected <Project>"), "unexpected root named");
}

void test_diagnostic_reporting() {
  ValidateSettings cfg;
  cfg.max_diagnostics = 2;

  const auto r = validate_manifest("<a>\n\x01\x02\x03\x04\x05</a>", cfg);
  expect_eq<std::size_t>(r.diagnostics.size(), 2, "diagnostics capped");
  expect_eq<std::size_t>(r.dropped_diagnostics, 3, "overflow counted");
  const auto lines = r.lines();
  expect_eq_str(lines.front(), "line 2: control character 0x01 (byte 4)", "diagnostic carries line and offset");
  expect_true(contains(lines.back(), "3 more diagnostics suppressed"), "suppressed count reported");
}

void test_acceptance_policy() {
  ValidateSettings strict;
  ValidateSettings lenient;
  lenient.strict_diagnostics = false;

  const auto soft = validate_manifest("<a>x\x01y</a>", strict);
  const std::string what = expect_throws<ValidationError>(
      [&] { validate::require_acceptable(soft, strict); }, "strict mode rejects diagnostics");
  expect_true(contains(what, "reboot"), "rejection tells the operator what to do");

  bool lenient_ok = true;
  try {
    validate::require_acceptable(soft, lenient);
  } catch (const ValidationError&) {
    lenient_ok = false;
  }
  expect_true(lenient_ok, "lenient mode accepts diagnostics");

  const auto hard = validate_manifest("<a><b></a>", lenient);
  try {
    validate::require_acceptable(hard, lenient);
    fail("lenient mode still rejects structural failures");
  } catch (const ValidationError& e) {
    pass("lenient mode still rejects structural failures");
    expect_true(e.structural(), "structural flag set");
    expect_true(!e.details().empty(), "details carried to the operator");
  }

  expect_throws<ConfigError>([] {
    ValidateSettings bad;
    bad.max_diagnostics = 0;
    (void)validate_manifest("<a/>", bad);
  }, "max_diagnostics range checked");
}

void test_canonical_form() {
  const NormalizeSettings two;
  NormalizeSettings four;
  four.indent_width = 4;

  const std::string lamp = normalize::canonicalize(kLamp, two);
  expect_eq_str(lamp, "<config>\n  <device name=\"Lamp\"/>\n</config>\n", "lamp canonical layout");
  expect_eq_str(normalize::canonicalize(lamp, two), lamp, "canonical form is idempotent");

  expect_eq_str(normalize::canonicalize(kLamp, four),
                "<config>\n    <device name=\"Lamp\"/>\n</config>\n", "indent width honoured");

  expect_eq_str(normalize::canonicalize("<a><b>hello world</b></a>", two),
                "<a>\n  <b>hello world</b>\n</a>\n", "text-only element stays on one line");

  expect_eq_str(normalize::canonicalize("<a>x<b/>y</a>", two), "<a>x<b/>y</a>\n",
                "mixed content is not reindented");

  const std::string messy = "<a>\r\n   <b x=\"1\"/>\n\t<c>t</c>\n\n</a>\n\n\n";
  const std::string tidy = normalize::canonicalize(messy, two);
  expect_eq_str(tidy, "<a>\n  <b x=\"1\"/>\n  <c>t</c>\n</a>\n", "inter-element whitespace normalized");
  expect_eq_str(normalize::canonicalize(tidy, two), tidy, "normalized messy input is a fixed point");

  expect_eq_str(normalize::canonicalize("<a t=\"x&amp;y\">1 &lt; 2</a>", two),
                "<a t=\"x&amp;y\">1 &lt; 2</a>\n", "entities re-escaped");

  expect_throws<ValidationError>([&] { (void)normalize::canonicalize("<a><b></a>", two); },
                                 "malformed input refused");
}

}  // namespace
}  // namespace devcfg

int main() {
  using namespace devcfg;

  set_log_level(LogLevel::ERROR);

  test_valid_documents();
  test_structural_failures();
  test_soft_diagnostics();
  test_diagnostic_reporting();
  test_acceptance_policy();
  test_canonical_form();

  return selftest::exit_code();
}
