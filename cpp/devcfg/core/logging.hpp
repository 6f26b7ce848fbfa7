#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/devcfg/core/logging.hpp
===========================================================
Purpose:
  - Minimal logging used by every pipeline stage.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr so operators and schedulers see them
    even when stdout is discarded.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace devcfg {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// "debug" | "info" | "warn" | "error" (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view s);

const char* to_string(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }

} // namespace devcfg
