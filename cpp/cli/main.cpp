/*
================================================================================
CLI: devcfg_fetch
FILE: cpp/cli/main.cpp

Purpose:
  - Fetch the device's configuration export, validate it, and atomically
    replace the canonical manifest the controller reads at startup.
  - Meant to be run by an operator or a scheduler; retries are theirs.

Usage:
  devcfg_fetch [--config <file>] [options]

Exit codes (stable, for schedulers):
  0  canonical manifest written
  1  device returned corrupt data (validation failed)
  2  could not reach device (network / HTTP failure)
  3  filesystem failure (raw or canonical artifact, input file)
  4  invalid arguments or settings
  5  another run holds the lock for the same output path
  6  unexpected internal error
================================================================================
*/

#include "devcfg/core/errors.hpp"
#include "devcfg/core/logging.hpp"
#include "devcfg/core/settings.hpp"
#include "devcfg/pipeline/config_pipeline.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devcfg {
namespace {

enum class ExitCode : int {
  kOk = 0,
  kValidation = 1,
  kTransport = 2,
  kFilesystem = 3,
  kUsage = 4,
  kBusy = 5,
  kInternal = 6,
};

int to_int(ExitCode c) { return static_cast<int>(c); }

static void print_usage(std::ostream& os) {
  os <<
    "devcfg_fetch [--config <file>] [options]\n"
    "\n"
    "Source (one of):\n"
    "  --url <http://host[:port]/path>   device export endpoint\n"
    "  --input <file>                    check a previously downloaded export\n"
    "\n"
    "Artifacts:\n"
    "  --out <path>                      canonical manifest (default lutron-DbXmlInfo.xml)\n"
    "  --raw <path>                      raw response body (default <out>.raw)\n"
    "  --keep-raw 0|1                    keep the raw body after success (default 0)\n"
    "  --lock 0|1                        refuse concurrent runs on <out>.lock (default 1)\n"
    "\n"
    "Transport:\n"
    "  --timeout-ms <n>                  whole-exchange budget (default 30000)\n"
    "  --max-bytes <n>                   response size cap (default 67108864)\n"
    "  --sanitize none|structural|fixed-lines   (default structural)\n"
    "  --trim-lines <n>                  lines dropped by fixed-lines (default 3)\n"
    "  --user-agent <string>             User-Agent header (default devcfg-fetch/1.0)\n"
    "\n"
    "Validation / output:\n"
    "  --strict-diagnostics 0|1          reject documents with soft diagnostics (default 1)\n"
    "  --expected-root <name>            required root element\n"
    "  --max-diagnostics <n>             diagnostics reported per run (default 50)\n"
    "  --indent <n>                      spaces per level in the canonical form (default 2)\n"
    "  --log-level debug|info|warn|error\n"
    "\n"
    "Exit codes: 0 ok, 1 corrupt data, 2 unreachable, 3 filesystem, 4 usage, 5 busy, 6 internal\n";
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

struct Args {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;  // key, value
};

// Flags that map 1:1 onto settings keys.
static bool is_setting_flag(std::string_view flag) {
  static const char* const kKeys[] = {
    "url", "input", "out", "raw", "keep-raw", "lock", "timeout-ms", "max-bytes",
    "sanitize", "trim-lines", "strict-diagnostics", "expected-root", "indent",
    "log-level", "max-diagnostics", "user-agent",
  };
  for (const char* k : kKeys) {
    if (flag == k) return true;
  }
  return false;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err, bool* help_requested) {
  for (int i = 1; i < argc; ++i) {
    const char* k = argv[i];

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      *help_requested = true;
      return true;
    }

    if (std::strncmp(k, "--", 2) != 0) {
      *err = std::string("Unexpected argument: ") + k;
      return false;
    }
    const std::string flag(k + 2);

    const char* v = nullptr;
    if (flag == "config") {
      if (!get_next(i, argc, argv, &v)) { *err = "--config requires a value"; return false; }
      a->config_path = v;
      continue;
    }
    if (is_setting_flag(flag)) {
      if (!get_next(i, argc, argv, &v)) { *err = "--" + flag + " requires a value"; return false; }
      a->overrides.emplace_back(flag, v);
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }
  return true;
}

static void report_validation_failure(const ValidationError& e) {
  log_error(std::string("DEVICE RETURNED CORRUPT DATA: ") + e.what());
  for (const auto& line : e.details()) {
    log_error("  " + line);
  }
}

static int run(const PipelineSettings& s) {
  try {
    const auto rep = pipeline::run_pipeline(s);
    log_info("done: " + rep.canonical_path + " from " + rep.source +
             (rep.changed ? " (updated)" : " (no change)"));
    if (!rep.raw_path.empty()) log_info("raw artifact kept at " + rep.raw_path);
    return to_int(ExitCode::kOk);
  } catch (const ValidationError& e) {
    report_validation_failure(e);
    return to_int(ExitCode::kValidation);
  } catch (const TransportError& e) {
    log_error(std::string("COULD NOT REACH DEVICE: ") + e.what() +
              " (check network connectivity and the endpoint URL)");
    return to_int(ExitCode::kTransport);
  } catch (const FilesystemError& e) {
    log_error(std::string("FILESYSTEM ERROR: ") + e.what());
    return to_int(ExitCode::kFilesystem);
  } catch (const BusyError& e) {
    log_error(std::string("BUSY: ") + e.what());
    return to_int(ExitCode::kBusy);
  } catch (const ConfigError& e) {
    log_error(std::string("CONFIG ERROR: ") + e.what());
    return to_int(ExitCode::kUsage);
  }
}

}  // namespace
}  // namespace devcfg

int main(int argc, char** argv) {
  using namespace devcfg;

  Args a{};
  std::string arg_err;
  bool help = false;
  if (!parse_args(argc, argv, &a, &arg_err, &help)) {
    std::cerr << "Argument error: " << arg_err << "\n\n";
    print_usage(std::cerr);
    return to_int(ExitCode::kUsage);
  }
  if (help) {
    print_usage(std::cout);
    return to_int(ExitCode::kOk);
  }

  PipelineSettings s = PipelineSettings::defaults();
  try {
    if (!a.config_path.empty()) load_settings_file(a.config_path, s);
    for (const auto& [key, value] : a.overrides) apply_setting(s, key, value);
    s.validate_or_throw();
  } catch (const ConfigError& e) {
    std::cerr << "Settings error: " << e.what() << "\n";
    return to_int(ExitCode::kUsage);
  }

  set_log_level(s.log_level);

  try {
    return run(s);
  } catch (const std::exception& e) {
    log_error(std::string("INTERNAL ERROR: ") + e.what());
    return to_int(ExitCode::kInternal);
  }
}
