#include "devcfg/core/hashing.hpp"

#include <iomanip>
#include <sstream>

namespace devcfg {

void Fnv1a64::update_bytes(const void* data, size_t n) {
  const auto* p = static_cast<const uint8_t*>(data);
  if (p == nullptr || n == 0) return;

  for (size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

Hash64 fingerprint(std::string_view bytes) {
  Fnv1a64 h;
  h.update(bytes);
  return Hash64{h.value()};
}

std::string hash_to_hex(Hash64 h) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << h.value;
  return oss.str();
}

}  // namespace devcfg
