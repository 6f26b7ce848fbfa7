#pragma once
/*
================================================================================
Core: Deterministic Hashing Utilities
FILE: cpp/devcfg/core/hashing.hpp

Purpose:
  - Stable 64-bit fingerprints for artifacts, so a run can report whether the
    canonical manifest actually changed since the last good run.

Notes:
  - This is NOT cryptographic. It is for change detection and log lines.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace devcfg {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// ----------------------------- FNV-1a 64 -------------------------------------
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}

  uint64_t value() const { return h_; }

  void update_bytes(const void* data, size_t n);
  void update(std::string_view s) { update_bytes(s.data(), s.size()); }

 private:
  uint64_t h_;
};

// Fingerprint of a whole byte string.
Hash64 fingerprint(std::string_view bytes);

// 16 lowercase hex digits.
std::string hash_to_hex(Hash64 h);

}  // namespace devcfg
