/*
  Transport Sanitizer Selftest

  Checks:
    1) Documents that already start with markup pass through untouched under
       every policy.
    2) Structural policy strips leaked header lines (the device's "\n\r"
       framing included) and nothing else.
    3) Fixed-lines policy drops exactly N lines, but never from a document
       that starts with markup.
    4) Header framing repair turns the device's framing into CRLF framing and
       refuses input that is not an HTTP response.

  Framework-free; non-zero exit code indicates failure.
*/

#include <string>

#include "devcfg/core/settings.hpp"
#include "devcfg/sanitize/transport_sanitizer.hpp"
#include "devcfg/testing/selftest.hpp"

namespace devcfg {
namespace {

using namespace selftest;
using sanitize::sanitize_body;

SanitizeSettings policy(SanitizePolicy p, int trim = 3) {
  SanitizeSettings s;
  s.policy = p;
  s.trim_lines = trim;
  return s;
}

void test_markup_detection() {
  expect_true(sanitize::starts_with_markup("<config/>"), "element start is markup");
  expect_true(sanitize::starts_with_markup("<?xml version=\"1.0\"?><a/>"), "declaration is markup");
  expect_true(sanitize::starts_with_markup("  \r\n<!-- c --><a/>"), "leading whitespace then comment");
  expect_true(sanitize::starts_with_markup("\xEF\xBB\xBF<a/>"), "BOM then element");
  expect_true(!sanitize::starts_with_markup("Content-Type: text/xml"), "header line is not markup");
  expect_true(!sanitize::starts_with_markup("< a>"), "'<' followed by space is not markup");
  expect_true(!sanitize::starts_with_markup(""), "empty is not markup");

  expect_true(sanitize::is_header_remnant("HTTP/1.1 200 OK\r"), "status line is a remnant");
  expect_true(sanitize::is_header_remnant("\r\rLast-Modified: Mon, 01 Jan 2024"), "CR-prefixed header");
  expect_true(sanitize::is_header_remnant("\r"), "lone CR is a remnant");
  expect_true(!sanitize::is_header_remnant("device name: Lamp and more"), "space before ':' is not a header");
  expect_true(!sanitize::is_header_remnant("garbage"), "plain text is not a header");
}

void test_passthrough() {
  const std::string doc = "<config><device name=\"Lamp\"/></config>";
  for (auto p : {SanitizePolicy::kNone, SanitizePolicy::kStructural, SanitizePolicy::kFixedLines}) {
    const auto r = sanitize_body(doc, policy(p));
    expect_eq_str(r.document, doc, std::string("clean document unchanged (") + to_string(p) + ")");
    expect_true(!r.changed(), std::string("nothing stripped (") + to_string(p) + ")");
  }

  const std::string junk = "Content-Type: text/xml\n\n<a/>";
  const auto r = sanitize_body(junk, policy(SanitizePolicy::kNone));
  expect_eq_str(r.document, junk, "policy none never touches the body");
}

void test_structural() {
  {
    const std::string body = "Last-Modified: Mon, 01 Jan 2024 00:00:00 GMT\n\r"
                             "Content-Type: text/xml\n\r\n"
                             "<config><device name=\"Lamp\"/></config>";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kStructural));
    expect_eq_str(r.document, "<config><device name=\"Lamp\"/></config>", "leaked headers stripped");
    expect_eq(r.lines_stripped, 3, "three remnant lines counted");
  }
  {
    const std::string body = "HTTP/1.0 200 OK\r\n\r\n<a>1</a>\n";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kStructural));
    expect_eq_str(r.document, "<a>1</a>\n", "whole leaked header block stripped");
    expect_eq(r.lines_stripped, 2, "status line and blank line counted");
  }
  {
    const std::string body = "\r\n\r\n<a>1</a>\n";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kStructural));
    expect_eq_str(r.document, body, "leading whitespace alone is not garbage");
  }
  {
    // Garbage that is not header-shaped is left for the validator to reject.
    const std::string body = "%%garbage%%\n<a/>";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kStructural));
    expect_eq_str(r.document, body, "non-header garbage passed through");
    expect_true(!r.changed(), "non-header garbage not counted as stripped");
  }
  {
    const std::string body = "Content-Type: text/xml\n\r\n";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kStructural));
    expect_eq_str(r.document, body, "headers without a document passed through");
  }
}

void test_fixed_lines() {
  {
    const std::string body = "l1\nl2\nl3\n<a/>";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kFixedLines, 3));
    expect_eq_str(r.document, "<a/>", "fixed-lines drops exactly three lines");
    expect_eq(r.lines_stripped, 3, "fixed-lines count");
  }
  {
    const std::string body = "l1\n<a/>";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kFixedLines, 3));
    expect_eq_str(r.document, "", "fixed-lines on a short body leaves nothing");
    expect_eq(r.lines_stripped, 2, "only existing lines counted");
  }
  {
    const std::string body = "<a>\n<b/>\n<c/>\n</a>";
    const auto r = sanitize_body(body, policy(SanitizePolicy::kFixedLines, 3));
    expect_eq_str(r.document, body, "fixed-lines never cuts into a document");
  }
}

void test_header_framing_repair() {
  const std::string body = "<config/>";
  const std::string device = "HTTP/1.0 200 OK\n\r\rContent-Type: text/xml\n\r\n" + body;
  const auto fixed = sanitize::repair_header_framing(device);
  expect_true(fixed.has_value(), "device framing repaired");
  if (fixed) {
    expect_eq_str(*fixed, "HTTP/1.0 200 OK\r\nContent-Type: text/xml\r\n\r\n" + body,
                  "repaired framing is CRLF");
  }

  const std::string no_blank = "HTTP/1.0 200 OK\n\rContent-Type: text/xml\n\r" + body + "\n";
  const auto fixed2 = sanitize::repair_header_framing(no_blank);
  expect_true(fixed2.has_value(), "header block ended by the document itself");
  if (fixed2) {
    expect_eq_str(*fixed2, "HTTP/1.0 200 OK\r\nContent-Type: text/xml\r\n\r\n" + body + "\n",
                  "body kept byte for byte");
  }

  const std::string compliant = "HTTP/1.1 200 OK\r\nContent-Length: 9\r\n\r\n" + body;
  expect_true(!sanitize::repair_header_framing(compliant).has_value(), "compliant response left alone");
  expect_true(!sanitize::repair_header_framing("garbage\n\n<a/>").has_value(), "non-HTTP input refused");
  expect_true(!sanitize::repair_header_framing("HTTP/1.0 200 OK").has_value(), "unterminated header refused");
}

}  // namespace
}  // namespace devcfg

int main() {
  using namespace devcfg;

  test_markup_detection();
  test_passthrough();
  test_structural();
  test_fixed_lines();
  test_header_framing_repair();

  return selftest::exit_code();
}
