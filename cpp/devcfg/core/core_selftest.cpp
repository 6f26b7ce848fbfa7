/*
  Core Selftest (settings, errors, fingerprints)

  Checks:
    1) Defaults validate and point at the device's export endpoint.
    2) apply_setting() accepts CLI and file spellings and rejects bad values
       and unknown keys with a message naming the key.
    3) validate_or_throw() range checks, raw/canonical path collision, and
       the offline-mode exemption for fetch settings.
    4) Settings files: comments, blank lines, CRLF, and file:line errors.
    5) FNV-1a fingerprints match published reference values.

  Framework-free; non-zero exit code indicates failure.
*/

#include <string>

#include "devcfg/core/errors.hpp"
#include "devcfg/core/hashing.hpp"
#include "devcfg/core/settings.hpp"
#include "devcfg/testing/selftest.hpp"
#include "devcfg/testing/temp_dir.hpp"

namespace devcfg {
namespace {

using namespace selftest;

void test_defaults() {
  const PipelineSettings s = PipelineSettings::defaults();
  expect_eq_str(s.fetch.url, "http://lutron-radiora/DbXmlInfo.xml", "default endpoint");
  expect_eq_str(s.output.canonical_path, "lutron-DbXmlInfo.xml", "default canonical path");
  expect_eq_str(s.output.effective_raw_path(), "lutron-DbXmlInfo.xml.raw", "raw path derived from canonical");
  expect_eq_str(s.output.lock_path(), "lutron-DbXmlInfo.xml.lock", "lock path derived from canonical");
  expect_true(s.validate.strict_diagnostics, "strict diagnostics by default");
  expect_true(s.sanitize.policy == SanitizePolicy::kStructural, "structural sanitizer by default");
  expect_true(!s.offline(), "network mode by default");

  bool ok = true;
  try {
    s.validate_or_throw();
  } catch (const ConfigError& e) {
    ok = false;
    std::cerr << "  " << e.what() << "\n";
  }
  expect_true(ok, "defaults validate");
}

void test_apply_setting() {
  PipelineSettings s;
  apply_setting(s, "url", "  http://10.0.0.5:8080/DbXmlInfo.xml ");
  apply_setting(s, "timeout-ms", "2500");
  apply_setting(s, "max_bytes", "1048576");
  apply_setting(s, "sanitize", "fixed-lines");
  apply_setting(s, "trim-lines", "4");
  apply_setting(s, "strict-diagnostics", "off");
  apply_setting(s, "keep_raw", "yes");
  apply_setting(s, "indent", "4");
  apply_setting(s, "log-level", "WARN");
  apply_setting(s, "expected-root", "Project");

  expect_eq_str(s.fetch.url, "http://10.0.0.5:8080/DbXmlInfo.xml", "url trimmed");
  expect_eq<int64_t>(s.fetch.timeout_ms, 2500, "timeout applied");
  expect_eq<uint64_t>(s.fetch.max_bytes, 1048576, "max_bytes applied");
  expect_true(s.sanitize.policy == SanitizePolicy::kFixedLines, "policy applied");
  expect_eq(s.sanitize.trim_lines, 4, "trim_lines applied");
  expect_true(!s.validate.strict_diagnostics, "strict_diagnostics off");
  expect_true(s.output.keep_raw, "keep_raw on");
  expect_eq(s.normalize.indent_width, 4, "indent applied");
  expect_true(s.log_level == LogLevel::WARN, "log level case-insensitive");
  expect_eq_str(s.validate.expected_root, "Project", "expected_root applied");

  std::string what = expect_throws<ConfigError>([&] { apply_setting(s, "colour", "blue"); },
                                                "unknown key rejected");
  expect_true(contains(what, "unknown setting 'colour'"), "unknown key named");

  what = expect_throws<ConfigError>([&] { apply_setting(s, "timeout_ms", "soon"); }, "non-numeric timeout rejected");
  expect_true(contains(what, "'timeout_ms'"), "bad value names the key");

  expect_throws<ConfigError>([&] { apply_setting(s, "max_bytes", "-1"); }, "negative max_bytes rejected");
  expect_throws<ConfigError>([&] { apply_setting(s, "keep_raw", "maybe"); }, "bad boolean rejected");
  expect_throws<ConfigError>([&] { apply_setting(s, "sanitize", "aggressive"); }, "bad policy rejected");
  expect_throws<ConfigError>([&] { apply_setting(s, "log_level", "loud"); }, "bad log level rejected");
}

void test_validation_ranges() {
  auto rejects = [](auto mutate, std::string_view msg) {
    PipelineSettings s;
    mutate(s);
    expect_throws<ConfigError>([&] { s.validate_or_throw(); }, msg);
  };

  rejects([](PipelineSettings& s) { s.fetch.timeout_ms = 50; }, "timeout below 100 ms rejected");
  rejects([](PipelineSettings& s) { s.fetch.max_bytes = 10; }, "tiny max_bytes rejected");
  rejects([](PipelineSettings& s) { s.fetch.url.clear(); }, "empty url rejected");
  rejects([](PipelineSettings& s) { s.sanitize.trim_lines = -1; }, "negative trim_lines rejected");
  rejects([](PipelineSettings& s) { s.normalize.indent_width = 9; }, "indent above 8 rejected");
  rejects([](PipelineSettings& s) { s.validate.max_diagnostics = 0; }, "zero max_diagnostics rejected");
  rejects([](PipelineSettings& s) { s.output.canonical_path.clear(); }, "empty canonical path rejected");
  rejects([](PipelineSettings& s) { s.output.raw_path = s.output.canonical_path; },
          "raw path equal to canonical rejected");

  PipelineSettings offline;
  offline.input_path = "export.xml";
  offline.fetch.url.clear();
  bool ok = true;
  try {
    offline.validate_or_throw();
  } catch (const ConfigError&) {
    ok = false;
  }
  expect_true(ok, "offline mode ignores fetch settings");
}

void test_settings_file() {
  TempDir dir("core");
  const std::string path = dir.file("fetch.conf");
  write_text(path,
             "# device export settings\r\n"
             "\r\n"
             "url = http://radiora.local/DbXmlInfo.xml\r\n"
             "  out=/var/lib/lutron/manifest.xml  \n"
             "timeout_ms = 5000   \n"
             "strict_diagnostics = 0\n");

  PipelineSettings s;
  load_settings_file(path, s);
  expect_eq_str(s.fetch.url, "http://radiora.local/DbXmlInfo.xml", "file url");
  expect_eq_str(s.output.canonical_path, "/var/lib/lutron/manifest.xml", "file out path");
  expect_eq<int64_t>(s.fetch.timeout_ms, 5000, "file timeout");
  expect_true(!s.validate.strict_diagnostics, "file strict_diagnostics");

  const std::string bad = dir.file("bad.conf");
  write_text(bad, "url = http://x/\nindent four\n");
  PipelineSettings s2;
  try {
    load_settings_file(bad, s2);
    fail("line without '=' rejected");
  } catch (const ConfigError& e) {
    pass("line without '=' rejected");
    expect_eq(e.line(), 2, "error carries the line number");
    expect_eq_str(e.file(), bad, "error carries the file");
    expect_true(contains(e.what(), bad + ":2:"), "message formatted as file:line");
  }

  const std::string badval = dir.file("badval.conf");
  write_text(badval, "indent = wide\n");
  PipelineSettings s3;
  const std::string what = expect_throws<ConfigError>([&] { load_settings_file(badval, s3); },
                                                      "bad value in file rejected");
  expect_true(contains(what, ":1:") && contains(what, "'indent'"), "bad value located and named");

  expect_throws<ConfigError>([&] { load_settings_file(dir.file("missing.conf"), s3); },
                             "missing settings file rejected");
}

void test_fingerprint() {
  expect_eq_str(hash_to_hex(fingerprint("")), "cbf29ce484222325", "fnv1a64 of empty input");
  expect_eq_str(hash_to_hex(fingerprint("a")), "af63dc4c8601ec8c", "fnv1a64 of 'a'");
  expect_true(fingerprint("<a/>\n") != fingerprint("<a/>"), "trailing newline changes the fingerprint");

  Fnv1a64 h;
  h.update("<con");
  h.update("fig/>");
  expect_true(h.value() == fingerprint("<config/>").value, "incremental update matches one-shot");
}

}  // namespace
}  // namespace devcfg

int main() {
  using namespace devcfg;

  test_defaults();
  test_apply_setting();
  test_validation_ranges();
  test_settings_file();
  test_fingerprint();

  return selftest::exit_code();
}
