#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace powerscore::util {

/*
  FNV-1a 64-bit. Stable across platforms and runs, used for cache keys.
*/
class Fnv1a {
 public:
  void Update(std::string_view data);
  void Update(std::int64_t value);

  std::uint64_t Digest() const {
    return state_;
  }

  std::string HexDigest() const;

 private:
  std::uint64_t state_ = 0xcbf29ce484222325ULL;
};

} // namespace powerscore::util
