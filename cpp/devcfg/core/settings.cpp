/*
================================================================================
Core: Pipeline Settings (Loader)
FILE: cpp/devcfg/core/settings.cpp
================================================================================
*/

#include "devcfg/core/settings.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>

namespace devcfg {

namespace {

std::string trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
  return std::string(s.substr(b, e - b));
}

// CLI spells keys with dashes, the settings file with underscores.
std::string canonical_key(std::string_view key) {
  std::string k(key);
  for (char& c : k) {
    if (c == '-') c = '_';
  }
  return k;
}

bool parse_bool01(const std::string& v, bool* out) {
  if (v == "1" || v == "true" || v == "yes" || v == "on") { *out = true; return true; }
  if (v == "0" || v == "false" || v == "no" || v == "off") { *out = false; return true; }
  return false;
}

bool parse_i64(const std::string& v, int64_t* out) {
  if (v.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long long x = std::strtoll(v.c_str(), &end, 10);
  if (end == v.c_str() || *end != '\0' || errno == ERANGE) return false;
  *out = static_cast<int64_t>(x);
  return true;
}

bool parse_u64(const std::string& v, uint64_t* out) {
  if (v.empty() || v[0] == '-') return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long long x = std::strtoull(v.c_str(), &end, 10);
  if (end == v.c_str() || *end != '\0' || errno == ERANGE) return false;
  *out = static_cast<uint64_t>(x);
  return true;
}

bool parse_int(const std::string& v, int* out) {
  int64_t x = 0;
  if (!parse_i64(v, &x)) return false;
  if (x < -2147483647LL || x > 2147483647LL) return false;
  *out = static_cast<int>(x);
  return true;
}

bool parse_policy(const std::string& v, SanitizePolicy* out) {
  if (v == "none")        { *out = SanitizePolicy::kNone;       return true; }
  if (v == "structural")  { *out = SanitizePolicy::kStructural; return true; }
  if (v == "fixed-lines" || v == "fixed_lines") {
    *out = SanitizePolicy::kFixedLines;
    return true;
  }
  return false;
}

[[noreturn]] void bad_value(const std::string& key, const std::string& value, const char* expected) {
  throw ConfigError("invalid value '" + value + "' for '" + key + "' (expected " + expected + ")");
}

} // namespace

const char* to_string(SanitizePolicy p) noexcept {
  switch (p) {
    case SanitizePolicy::kNone:       return "none";
    case SanitizePolicy::kStructural: return "structural";
    case SanitizePolicy::kFixedLines: return "fixed-lines";
    default:                          return "unknown";
  }
}

void apply_setting(PipelineSettings& s, std::string_view key_in, std::string_view value_in) {
  const std::string key = canonical_key(key_in);
  const std::string v = trim(value_in);

  if (key == "url") {
    s.fetch.url = v;
  } else if (key == "input") {
    s.input_path = v;
  } else if (key == "out") {
    s.output.canonical_path = v;
  } else if (key == "raw") {
    s.output.raw_path = v;
  } else if (key == "keep_raw") {
    if (!parse_bool01(v, &s.output.keep_raw)) bad_value(key, v, "0|1");
  } else if (key == "lock") {
    if (!parse_bool01(v, &s.output.lock)) bad_value(key, v, "0|1");
  } else if (key == "timeout_ms") {
    if (!parse_i64(v, &s.fetch.timeout_ms)) bad_value(key, v, "integer milliseconds");
  } else if (key == "max_bytes") {
    if (!parse_u64(v, &s.fetch.max_bytes)) bad_value(key, v, "byte count");
  } else if (key == "user_agent") {
    s.fetch.user_agent = v;
  } else if (key == "sanitize") {
    if (!parse_policy(v, &s.sanitize.policy)) bad_value(key, v, "none|structural|fixed-lines");
  } else if (key == "trim_lines") {
    if (!parse_int(v, &s.sanitize.trim_lines)) bad_value(key, v, "integer");
  } else if (key == "strict_diagnostics") {
    if (!parse_bool01(v, &s.validate.strict_diagnostics)) bad_value(key, v, "0|1");
  } else if (key == "expected_root") {
    s.validate.expected_root = v;
  } else if (key == "max_diagnostics") {
    if (!parse_int(v, &s.validate.max_diagnostics)) bad_value(key, v, "integer");
  } else if (key == "indent") {
    if (!parse_int(v, &s.normalize.indent_width)) bad_value(key, v, "integer");
  } else if (key == "log_level") {
    const auto lvl = parse_log_level(v);
    if (!lvl) bad_value(key, v, "debug|info|warn|error");
    s.log_level = *lvl;
  } else {
    throw ConfigError("unknown setting '" + std::string(key_in) + "'");
  }
}

void load_settings_file(const std::string& path, PipelineSettings& s) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw ConfigError(path, 0, "cannot open settings file");
  }

  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;

    const size_t eq = t.find('=');
    if (eq == std::string::npos) {
      throw ConfigError(path, lineno, "expected 'key = value'");
    }
    const std::string key = trim(std::string_view(t).substr(0, eq));
    if (key.empty()) {
      throw ConfigError(path, lineno, "empty key");
    }

    try {
      apply_setting(s, key, std::string_view(t).substr(eq + 1));
    } catch (const ConfigError& e) {
      throw ConfigError(path, lineno, e.what());
    }
  }
  if (in.bad()) {
    throw ConfigError(path, lineno, "read error");
  }
}

}  // namespace devcfg
