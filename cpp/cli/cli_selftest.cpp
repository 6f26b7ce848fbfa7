/*
  CLI Selftest: devcfg_fetch exit-code contract

  Runs the real devcfg_fetch binary (path passed as argv[1]) and checks:
    0  clean export, offline and over HTTP
    1  corrupt export, with "DEVICE RETURNED CORRUPT DATA" on stderr
    2  unreachable device, with "COULD NOT REACH DEVICE" on stderr
    4  unknown flag, bad setting value, missing settings file
    5  output lock held by another holder
  and that no failing run touches the previous canonical manifest.

  Framework-free; non-zero exit code indicates failure.
*/

#include <cstdlib>
#include <iostream>
#include <string>

#include <sys/wait.h>

#include "devcfg/pipeline/instance_lock.hpp"
#include "devcfg/testing/loopback_http_server.hpp"
#include "devcfg/testing/selftest.hpp"
#include "devcfg/testing/temp_dir.hpp"

namespace devcfg {
namespace {

using namespace selftest;

const std::string kLamp = "<config><device name=\"Lamp\"/></config>";
const std::string kLampCanonical = "<config>\n  <device name=\"Lamp\"/>\n</config>\n";
const std::string kUnbalanced = "<config><device name=\"Lamp\"></config>";
const std::string kPrevious = "<config>\n  <device name=\"Previous\"/>\n</config>\n";

std::string g_binary;

struct RunResult {
  int exit_code = -1;
  std::string err;  // captured stderr
};

std::string quoted(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  return out + "'";
}

RunResult run_cli(const TempDir& dir, const std::string& args) {
  const std::string err_path = dir.file("stderr.txt");
  const std::string cmd = devcfg::quoted(g_binary) + " " + args + " >/dev/null 2>" + devcfg::quoted(err_path);
  const int status = std::system(cmd.c_str());

  RunResult r;
  if (status != -1 && WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
  r.err = read_text(err_path);
  return r;
}

void expect_exit(const RunResult& r, int want, std::string_view msg) {
  if (r.exit_code != want) {
    fail(msg);
    std::cerr << "  exit " << r.exit_code << ", want " << want << "\n";
    std::cerr << "  stderr: " << r.err << "\n";
  } else {
    pass(msg);
  }
}

std::string out_args(const TempDir& dir) {
  return "--out " + devcfg::quoted(dir.file("lutron-DbXmlInfo.xml"));
}

void test_success() {
  {
    TempDir dir("cli-offline");
    write_text(dir.file("export.xml"), kLamp);
    const auto r = run_cli(dir, "--input " + devcfg::quoted(dir.file("export.xml")) + " " + out_args(dir));
    expect_exit(r, 0, "offline clean export exits 0");
    expect_eq_str(read_text(dir.file("lutron-DbXmlInfo.xml")), kLampCanonical, "offline canonical manifest");
  }
  {
    TempDir dir("cli-http");
    LoopbackHttpServer srv(http_response(200, "OK", kLamp));
    const auto r = run_cli(dir, "--url " + devcfg::quoted(srv.url()) + " --timeout-ms 5000 " + out_args(dir));
    expect_exit(r, 0, "clean export over HTTP exits 0");
    expect_eq_str(read_text(dir.file("lutron-DbXmlInfo.xml")), kLampCanonical, "HTTP canonical manifest");
  }
  {
    TempDir dir("cli-help");
    expect_exit(run_cli(dir, "--help"), 0, "--help exits 0");
  }
}

void test_validation_failure() {
  {
    TempDir dir("cli-corrupt");
    write_text(dir.file("export.xml"), kUnbalanced);
    write_text(dir.file("lutron-DbXmlInfo.xml"), kPrevious);
    const auto r = run_cli(dir, "--input " + devcfg::quoted(dir.file("export.xml")) + " " + out_args(dir));
    expect_exit(r, 1, "unbalanced export exits 1");
    expect_true(contains(r.err, "DEVICE RETURNED CORRUPT DATA"), "corrupt-data wording on stderr");
    expect_eq_str(read_text(dir.file("lutron-DbXmlInfo.xml")), kPrevious, "corrupt export keeps previous manifest");
  }
  {
    TempDir dir("cli-corrupt-http");
    LoopbackHttpServer srv(http_response(200, "OK", kUnbalanced));
    const auto r = run_cli(dir, "--url " + devcfg::quoted(srv.url()) + " --timeout-ms 5000 " + out_args(dir));
    expect_exit(r, 1, "unbalanced export over HTTP exits 1");
    expect_true(exists(dir.file("lutron-DbXmlInfo.xml.raw")), "raw artifact left for inspection");
  }
}

void test_transport_failure() {
  TempDir dir("cli-refused");
  write_text(dir.file("lutron-DbXmlInfo.xml"), kPrevious);
  const std::string url = "http://127.0.0.1:" + std::to_string(unused_loopback_port()) + "/DbXmlInfo.xml";
  const auto r = run_cli(dir, "--url " + devcfg::quoted(url) + " --timeout-ms 2000 " + out_args(dir));
  expect_exit(r, 2, "refused connection exits 2");
  expect_true(contains(r.err, "COULD NOT REACH DEVICE"), "unreachable wording on stderr");
  expect_true(!contains(r.err, "CORRUPT DATA"), "unreachable is not reported as corrupt data");
  expect_eq_str(read_text(dir.file("lutron-DbXmlInfo.xml")), kPrevious, "unreachable device keeps previous manifest");
  expect_true(!exists(dir.file("lutron-DbXmlInfo.xml.raw")), "no raw artifact without a response");
}

void test_usage_errors() {
  TempDir dir("cli-usage");
  expect_exit(run_cli(dir, "--no-such-flag 1"), 4, "unknown flag exits 4");
  expect_exit(run_cli(dir, "--url"), 4, "flag without a value exits 4");
  expect_exit(run_cli(dir, "--timeout-ms soon"), 4, "bad setting value exits 4");
  expect_exit(run_cli(dir, "--url ftp://device/x " + out_args(dir)), 4, "unsupported scheme exits 4");
  expect_exit(run_cli(dir, "--config " + devcfg::quoted(dir.file("missing.conf"))), 4, "missing settings file exits 4");
}

void test_busy() {
  TempDir dir("cli-busy");
  write_text(dir.file("export.xml"), kLamp);
  write_text(dir.file("lutron-DbXmlInfo.xml"), kPrevious);
  pipeline::InstanceLock held(dir.file("lutron-DbXmlInfo.xml.lock"));
  const auto r = run_cli(dir, "--input " + devcfg::quoted(dir.file("export.xml")) + " " + out_args(dir));
  expect_exit(r, 5, "held lock exits 5");
  expect_eq_str(read_text(dir.file("lutron-DbXmlInfo.xml")), kPrevious, "busy run keeps previous manifest");
}

}  // namespace
}  // namespace devcfg

int main(int argc, char** argv) {
  using namespace devcfg;

  if (argc < 2) {
    std::cerr << "usage: cli_selftest <path-to-devcfg_fetch>\n";
    return 2;
  }
  g_binary = argv[1];

  test_success();
  test_validation_failure();
  test_transport_failure();
  test_usage_errors();
  test_busy();

  return selftest::exit_code();
}
