#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <random>
#include <vector>

namespace powerscore::ml {

// `fraction` of [0, n) without replacement, at least one, in ascending order.
inline std::vector<std::size_t> SampleWithoutReplacement(std::size_t n, double fraction, std::mt19937& rng) {
  std::vector<std::size_t> all(n);
  std::iota(all.begin(), all.end(), std::size_t{0});
  if (fraction >= 1.0 || n == 0) return all;

  std::shuffle(all.begin(), all.end(), rng);
  const auto k = std::max<std::size_t>(1, static_cast<std::size_t>(fraction * static_cast<double>(n)));
  all.resize(std::min(k, n));
  std::sort(all.begin(), all.end());
  return all;
}

inline std::vector<std::size_t> Bootstrap(std::size_t n, std::mt19937& rng) {
  std::vector<std::size_t> out(n);
  if (n == 0) return out;

  std::uniform_int_distribution<std::size_t> pick(0, n - 1);
  for (auto& r : out) {
    r = pick(rng);
  }
  return out;
}

} // namespace powerscore::ml
