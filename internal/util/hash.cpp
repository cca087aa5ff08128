#include "hash.hpp"

#include <cstdio>

namespace powerscore::util {

namespace {
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;
}

void Fnv1a::Update(std::string_view data) {
  for (unsigned char c : data) {
    state_ ^= c;
    state_ *= kFnvPrime;
  }
  // field separator so ("ab","c") and ("a","bc") differ
  state_ ^= 0xff;
  state_ *= kFnvPrime;
}

void Fnv1a::Update(std::int64_t value) {
  Update(std::string_view(std::to_string(value)));
}

std::string Fnv1a::HexDigest() const {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(state_));
  return buf;
}

} // namespace powerscore::util
