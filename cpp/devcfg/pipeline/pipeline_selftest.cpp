/*
  Pipeline Selftest (end to end against a loopback device)

  Checks:
    1) A clean export becomes the canonical manifest, also when the device
       keeps the connection open; the raw artifact is removed unless keep_raw.
    2) Every failure class (corrupt document, unreachable device, HTTP error,
       busy lock, unwritable output) leaves the previous canonical manifest
       byte-for-byte intact.
    3) Validation failures keep the raw artifact for inspection; transport
       failures never create one.
    4) Sanitizer policies, device header framing, lenient diagnostics and
       offline input all flow through the same stages.
    5) Re-running on an unchanged export reports "unchanged".

  Framework-free; non-zero exit code indicates failure.
*/

#include <string>

#include "devcfg/core/errors.hpp"
#include "devcfg/core/settings.hpp"
#include "devcfg/pipeline/config_pipeline.hpp"
#include "devcfg/pipeline/instance_lock.hpp"
#include "devcfg/testing/loopback_http_server.hpp"
#include "devcfg/testing/selftest.hpp"
#include "devcfg/testing/temp_dir.hpp"

namespace devcfg {
namespace {

using namespace selftest;
using pipeline::run_pipeline;

const std::string kLamp = "<config><device name=\"Lamp\"/></config>";
const std::string kLampCanonical = "<config>\n  <device name=\"Lamp\"/>\n</config>\n";
const std::string kPrevious = "<config>\n  <device name=\"Previous\"/>\n</config>\n";

PipelineSettings settings_for(const TempDir& dir, const std::string& url) {
  PipelineSettings s;
  s.fetch.url = url;
  s.fetch.timeout_ms = 5000;
  s.output.canonical_path = dir.file("lutron-DbXmlInfo.xml");
  return s;
}

// Runs the pipeline expecting failure of type E and checks that the previous
// canonical manifest survived.
template <class E>
void expect_rejected_keeps_previous(const PipelineSettings& s, std::string_view msg) {
  write_text(s.output.canonical_path, kPrevious);
  expect_throws<E>([&] { (void)run_pipeline(s); }, msg);
  expect_eq_str(read_text(s.output.canonical_path), kPrevious, std::string(msg) + ": previous manifest intact");
}

void test_success_path() {
  TempDir dir("pipeline-ok");
  LoopbackHttpServer srv(http_response(200, "OK", kLamp));
  const auto s = settings_for(dir, srv.url());

  const auto rep = run_pipeline(s);
  expect_eq_str(read_text(s.output.canonical_path), kLampCanonical, "canonical manifest written");
  expect_eq<unsigned>(rep.http_status, 200, "status reported");
  expect_true(rep.validation.ok(), "validation reported valid");
  expect_true(rep.changed, "first run is a change");
  expect_true(!rep.previous_hash.has_value(), "no previous manifest");
  expect_eq<std::size_t>(rep.canonical_bytes, kLampCanonical.size(), "canonical size reported");
  expect_true(rep.raw_path.empty(), "report lists no raw artifact");
  expect_true(!exists(s.output.effective_raw_path()), "raw artifact removed after success");
}

void test_held_open_connection() {
  TempDir dir("pipeline-keep-open");
  LoopbackHttpServer srv(http_response(200, "OK", kLamp), LoopbackHttpServer::Mode::kRespondKeepOpen);
  auto s = settings_for(dir, srv.url());
  s.fetch.timeout_ms = 3000;
  const auto rep = run_pipeline(s);
  expect_eq<unsigned>(rep.http_status, 200, "held-open connection: status");
  expect_eq_str(read_text(s.output.canonical_path), kLampCanonical, "held-open connection: manifest written");
}

void test_unchanged_rerun() {
  TempDir dir("pipeline-rerun");
  LoopbackHttpServer first(http_response(200, "OK", kLamp));
  auto s = settings_for(dir, first.url());
  const auto r1 = run_pipeline(s);

  LoopbackHttpServer second(http_response(200, "OK", kLamp));
  s.fetch.url = second.url();
  const auto r2 = run_pipeline(s);
  expect_true(!r2.changed, "identical export reported unchanged");
  expect_true(r2.previous_hash.has_value() && *r2.previous_hash == r1.canonical_hash, "previous fingerprint matches");
  expect_eq_str(read_text(s.output.canonical_path), kLampCanonical, "canonical manifest still correct");
}

void test_keep_raw() {
  TempDir dir("pipeline-keep");
  LoopbackHttpServer srv(http_response(200, "OK", kLamp));
  auto s = settings_for(dir, srv.url());
  s.output.keep_raw = true;
  s.output.raw_path = dir.file("download.raw");

  const auto rep = run_pipeline(s);
  expect_eq_str(rep.raw_path, dir.file("download.raw"), "kept raw artifact reported");
  expect_eq_str(read_text(dir.file("download.raw")), kLamp, "raw artifact holds the body as received");
}

void test_corrupt_documents() {
  {
    TempDir dir("pipeline-unbalanced");
    const std::string body = "<config><device name=\"Lamp\"></config>";
    LoopbackHttpServer srv(http_response(200, "OK", body));
    const auto s = settings_for(dir, srv.url());
    expect_rejected_keeps_previous<ValidationError>(s, "unbalanced export rejected");
    expect_true(exists(s.output.effective_raw_path()), "raw artifact kept for inspection");
    expect_eq_str(read_text(s.output.effective_raw_path()), body, "raw artifact holds the rejected body");
  }
  {
    TempDir dir("pipeline-truncated");
    LoopbackHttpServer srv(http_response(200, "OK", "<config><device name=\"La"));
    const auto s = settings_for(dir, srv.url());
    try {
      (void)run_pipeline(s);
      fail("export truncated mid-tag rejected");
    } catch (const ValidationError& e) {
      pass("export truncated mid-tag rejected");
      expect_true(e.structural(), "truncation is a structural failure");
    }
    expect_true(!exists(s.output.canonical_path), "no canonical manifest created");
  }
  {
    TempDir dir("pipeline-empty");
    LoopbackHttpServer srv(http_response(200, "OK", ""));
    expect_rejected_keeps_previous<ValidationError>(settings_for(dir, srv.url()), "empty body rejected");
  }
  {
    TempDir dir("pipeline-control");
    const std::string body = "<config><device name=\"La\x01mp\"/></config>";
    LoopbackHttpServer srv(http_response(200, "OK", body));
    const auto s = settings_for(dir, srv.url());
    try {
      write_text(s.output.canonical_path, kPrevious);
      (void)run_pipeline(s);
      fail("control character rejected in strict mode");
    } catch (const ValidationError& e) {
      pass("control character rejected in strict mode");
      expect_true(!e.structural(), "diagnostic failure is not structural");
      bool named = false;
      for (const auto& d : e.details()) named = named || contains(d, "control character 0x01");
      expect_true(named, "diagnostic carried to the operator");
    }
    expect_eq_str(read_text(s.output.canonical_path), kPrevious, "strict rejection keeps previous manifest");
  }
  {
    TempDir dir("pipeline-lenient");
    LoopbackHttpServer srv(http_response(200, "OK", "<config><device name=\"La\x01mp\"/></config>"));
    auto s = settings_for(dir, srv.url());
    s.validate.strict_diagnostics = false;
    const auto rep = run_pipeline(s);
    expect_true(rep.validation.outcome == validate::ValidationOutcome::kSuspiciousDiagnostics,
                "lenient run reports the diagnostics");
    expect_true(exists(s.output.canonical_path), "lenient run writes the manifest");
  }
}

void test_transport_failures() {
  {
    TempDir dir("pipeline-refused");
    const auto s = settings_for(dir, "http://127.0.0.1:" + std::to_string(unused_loopback_port()) + "/DbXmlInfo.xml");
    expect_rejected_keeps_previous<TransportError>(s, "unreachable device");
    expect_true(!exists(s.output.effective_raw_path()), "no raw artifact without a response");
  }
  {
    TempDir dir("pipeline-fresh");
    const auto s = settings_for(dir, "http://127.0.0.1:" + std::to_string(unused_loopback_port()) + "/DbXmlInfo.xml");
    expect_throws<TransportError>([&] { (void)run_pipeline(s); }, "unreachable device on first run");
    expect_true(!exists(s.output.canonical_path), "no canonical manifest created");
  }
  {
    TempDir dir("pipeline-500");
    LoopbackHttpServer srv(http_response(500, "Internal Server Error", "oops"));
    const auto s = settings_for(dir, srv.url());
    expect_rejected_keeps_previous<TransportError>(s, "HTTP 500");
    expect_true(!exists(s.output.effective_raw_path()), "no raw artifact for an error status");
  }
}

void test_transport_garbage() {
  {
    TempDir dir("pipeline-remnants");
    LoopbackHttpServer srv(http_response(200, "OK", "Content-Type: text/xml\r\n\r\n" + kLamp));
    const auto s = settings_for(dir, srv.url());
    const auto rep = run_pipeline(s);
    expect_eq(rep.lines_stripped, 2, "leaked header lines stripped");
    expect_eq_str(read_text(s.output.canonical_path), kLampCanonical, "manifest free of header remnants");
  }
  {
    TempDir dir("pipeline-fixed");
    LoopbackHttpServer srv(http_response(200, "OK", kLamp));
    auto s = settings_for(dir, srv.url());
    s.sanitize.policy = SanitizePolicy::kFixedLines;
    const auto rep = run_pipeline(s);
    expect_eq(rep.lines_stripped, 0, "fixed-lines leaves a clean export alone");
    expect_eq_str(read_text(s.output.canonical_path), kLampCanonical, "fixed-lines manifest correct");
  }
  {
    TempDir dir("pipeline-framing");
    LoopbackHttpServer srv("HTTP/1.1 200 OK\n\r\rContent-Type: text/xml\n\r\n" + kLamp);
    const auto s = settings_for(dir, srv.url());
    const auto rep = run_pipeline(s);
    expect_true(rep.header_repaired, "device header framing repaired");
    expect_eq_str(read_text(s.output.canonical_path), kLampCanonical, "repaired export canonicalized");
  }
}

void test_offline_input() {
  TempDir dir("pipeline-offline");
  PipelineSettings s;
  s.input_path = dir.file("export.xml");
  s.output.canonical_path = dir.file("lutron-DbXmlInfo.xml");
  write_text(s.input_path, kLamp);

  const auto rep = run_pipeline(s);
  expect_eq<unsigned>(rep.http_status, 0, "no HTTP status offline");
  expect_eq_str(rep.source, s.input_path, "input file reported as source");
  expect_eq_str(read_text(s.output.canonical_path), kLampCanonical, "offline manifest written");
  expect_true(!exists(s.output.effective_raw_path()), "offline run writes no raw artifact");

  s.input_path = dir.file("missing.xml");
  expect_rejected_keeps_previous<FilesystemError>(s, "missing input file");
}

void test_lock_and_filesystem() {
  {
    TempDir dir("pipeline-busy");
    LoopbackHttpServer srv(http_response(200, "OK", kLamp));
    const auto s = settings_for(dir, srv.url());
    pipeline::InstanceLock held(s.output.lock_path());
    expect_rejected_keeps_previous<BusyError>(s, "concurrent run refused");
  }
  {
    TempDir dir("pipeline-nodir");
    PipelineSettings s;
    s.input_path = dir.file("export.xml");
    s.output.canonical_path = dir.file("no/such/dir/lutron-DbXmlInfo.xml");
    s.output.lock = false;
    write_text(s.input_path, kLamp);
    expect_throws<FilesystemError>([&] { (void)run_pipeline(s); }, "unwritable output directory");
  }
}

}  // namespace
}  // namespace devcfg

int main() {
  using namespace devcfg;

  set_log_level(LogLevel::ERROR);

  test_success_path();
  test_held_open_connection();
  test_unchanged_rerun();
  test_keep_raw();
  test_corrupt_documents();
  test_transport_failures();
  test_transport_garbage();
  test_offline_input();
  test_lock_and_filesystem();

  return selftest::exit_code();
}
