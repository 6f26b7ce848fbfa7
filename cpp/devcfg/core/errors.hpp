#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/devcfg/core/errors.hpp

Purpose:
  - One exception type per failure class so the CLI can tell an operator
    whether to check the network ("could not reach device") or the device
    itself ("device returned corrupt data").
  - Every failure is terminal for the current run. Retry policy belongs to
    whoever invoked the pipeline.

Hardening:
  - Small, dependency-free exceptions.
  - Safe what() storage via std::string.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace devcfg {

// Base error for the pipeline.
class DevcfgError : public std::runtime_error {
 public:
  explicit DevcfgError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Settings file, command line, or endpoint URL rejected.
class ConfigError : public DevcfgError {
 public:
  explicit ConfigError(std::string msg) : DevcfgError(std::move(msg)) {}

  ConfigError(const std::string& file, int line, const std::string& msg)
      : DevcfgError(format_location(file, line) + msg), file_(file), line_(line) {}

  const std::string& file() const noexcept { return file_; }
  int line() const noexcept { return line_; }

 private:
  static std::string format_location(const std::string& file, int line) {
    std::string s;
    if (!file.empty()) s += file + ":";
    if (line > 0) s += std::to_string(line) + ": ";
    else if (!s.empty()) s += " ";
    return s;
  }

  std::string file_;
  int line_ = 0;
};

// Network or HTTP failure: unreachable, refused, timed out, non-2xx status,
// unparseable response framing.
class TransportError : public DevcfgError {
 public:
  explicit TransportError(std::string msg) : DevcfgError(std::move(msg)) {}
};

// Manifest rejected: hard parse failure or soft diagnostics under strict mode.
class ValidationError : public DevcfgError {
 public:
  ValidationError(std::string msg, bool structural, std::vector<std::string> details)
      : DevcfgError(std::move(msg)), structural_(structural), details_(std::move(details)) {}

  // true: document did not parse. false: parsed, but diagnostics were raised.
  bool structural() const noexcept { return structural_; }
  const std::vector<std::string>& details() const noexcept { return details_; }

 private:
  bool structural_;
  std::vector<std::string> details_;
};

// Unable to read input or write the temp/final artifact.
class FilesystemError : public DevcfgError {
 public:
  explicit FilesystemError(std::string msg) : DevcfgError(std::move(msg)) {}
};

// Another run already holds the lock on the same output path.
class BusyError : public DevcfgError {
 public:
  explicit BusyError(std::string msg) : DevcfgError(std::move(msg)) {}
};

} // namespace devcfg
