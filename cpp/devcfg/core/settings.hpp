#pragma once
/*
================================================================================
Core: Pipeline Settings
FILE: cpp/devcfg/core/settings.hpp

Purpose:
  - Centralize every knob of a retrieval run (endpoint, paths, timeouts,
    sanitizer policy, validation strictness, canonical indentation) in one
    validated object that is passed into the pipeline explicitly.
  - Nothing here is process-global; tests point the same pipeline at a
    loopback server and a temp directory.

Hardening:
  - validate_or_throw() rejects nonsensical values before any I/O.
  - Conservative defaults: 30 s network budget, strict diagnostics.

Sources (lowest to highest precedence):
  - built-in defaults
  - settings file: `key = value` lines, '#' comments
  - command-line flags (same keys, see cli/main.cpp)
================================================================================
*/

#include <cstdint>
#include <string>
#include <string_view>

#include "devcfg/core/errors.hpp"
#include "devcfg/core/logging.hpp"

namespace devcfg {

// ----------------------------- Fetch -----------------------------------------
struct FetchSettings {
  // Device export endpoint. Only plain http:// is supported by the device.
  std::string url = "http://lutron-radiora/DbXmlInfo.xml";

  // Budget for the whole exchange (connect + request + response), ms.
  int64_t timeout_ms = 30000;

  // Upper bound on the raw response size (status line + headers + body).
  uint64_t max_bytes = 64ull * 1024ull * 1024ull;

  std::string user_agent = "devcfg-fetch/1.0";

  void validate_or_throw() const {
    if (url.empty()) {
      throw ConfigError("FetchSettings: url must not be empty");
    }
    if (timeout_ms < 100 || timeout_ms > 600000) {
      throw ConfigError("FetchSettings: timeout_ms must be in [100, 600000]");
    }
    if (max_bytes < 1024 || max_bytes > (1ull << 32)) {
      throw ConfigError("FetchSettings: max_bytes must be in [1 KiB, 4 GiB]");
    }
  }
};

// ----------------------------- Sanitize --------------------------------------
enum class SanitizePolicy : int {
  kNone = 0,        // pass the body through untouched
  kStructural = 1,  // drop leaked header lines up to the first markup line
  kFixedLines = 2   // legacy: drop the first N lines unless body already starts with markup
};

struct SanitizeSettings {
  SanitizePolicy policy = SanitizePolicy::kStructural;

  // Only used by kFixedLines. The device's firmware leaks three lines
  // (status remnant, Last-Modified, Content-Type).
  int trim_lines = 3;

  void validate_or_throw() const {
    if (trim_lines < 0 || trim_lines > 64) {
      throw ConfigError("SanitizeSettings: trim_lines must be in [0, 64]");
    }
  }
};

// ----------------------------- Validate --------------------------------------
struct ValidateSettings {
  // Treat soft diagnostics as failure. Off only for ad-hoc inspection.
  bool strict_diagnostics = true;

  // Required root element name; empty accepts any root.
  std::string expected_root;

  // Cap on diagnostics collected per document (keeps garbage exports from
  // flooding the log).
  int max_diagnostics = 50;

  void validate_or_throw() const {
    if (max_diagnostics < 1 || max_diagnostics > 10000) {
      throw ConfigError("ValidateSettings: max_diagnostics must be in [1, 10000]");
    }
  }
};

// ----------------------------- Normalize -------------------------------------
struct NormalizeSettings {
  // Spaces per nesting level in the canonical artifact.
  int indent_width = 2;

  void validate_or_throw() const {
    if (indent_width < 0 || indent_width > 8) {
      throw ConfigError("NormalizeSettings: indent_width must be in [0, 8]");
    }
  }
};

// ----------------------------- Output ----------------------------------------
struct OutputSettings {
  // Canonical artifact consumed by the controller.
  std::string canonical_path = "lutron-DbXmlInfo.xml";

  // Raw response body; empty means "<canonical_path>.raw".
  std::string raw_path;

  // Keep the raw artifact after a successful run.
  bool keep_raw = false;

  // Hold an advisory lock on "<canonical_path>.lock" for the whole run.
  bool lock = true;

  std::string effective_raw_path() const {
    return raw_path.empty() ? canonical_path + ".raw" : raw_path;
  }

  std::string lock_path() const { return canonical_path + ".lock"; }

  void validate_or_throw() const {
    if (canonical_path.empty()) {
      throw ConfigError("OutputSettings: canonical_path must not be empty");
    }
    if (effective_raw_path() == canonical_path) {
      throw ConfigError("OutputSettings: raw_path must differ from canonical_path");
    }
  }
};

// ----------------------------- PipelineSettings ------------------------------
struct PipelineSettings {
  // When set, read the manifest from this file instead of fetching it.
  std::string input_path;

  FetchSettings fetch;
  SanitizeSettings sanitize;
  ValidateSettings validate;
  NormalizeSettings normalize;
  OutputSettings output;

  LogLevel log_level = LogLevel::INFO;

  bool offline() const noexcept { return !input_path.empty(); }

  void validate_or_throw() const {
    if (!offline()) fetch.validate_or_throw();
    sanitize.validate_or_throw();
    validate.validate_or_throw();
    normalize.validate_or_throw();
    output.validate_or_throw();
  }

  static PipelineSettings defaults() {
    PipelineSettings s;
    return s;
  }
};

const char* to_string(SanitizePolicy p) noexcept;

// Apply one `key = value` pair. Throws ConfigError for unknown keys or
// unparseable values. Used by both the settings file and the CLI.
void apply_setting(PipelineSettings& s, std::string_view key, std::string_view value);

// Load a settings file on top of `s`. Errors carry file:line.
void load_settings_file(const std::string& path, PipelineSettings& s);

}  // namespace devcfg
