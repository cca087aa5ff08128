#include "normalization.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace powerscore::rating {

namespace {

std::vector<std::size_t> SortedOrder(const std::vector<double>& values) {
  std::vector<std::size_t> order(values.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return values[a] < values[b]; });
  return order;
}

} // namespace

double Clip(double value, double lo, double hi) {
  return std::min(std::max(value, lo), hi);
}

double Mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double PopulationSd(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  const double mu  = Mean(values);
  double       acc = 0.0;
  for (double v : values) {
    acc += (v - mu) * (v - mu);
  }
  return std::sqrt(acc / static_cast<double>(values.size()));
}

std::vector<double> AverageRanks(const std::vector<double>& values) {
  const auto          order = SortedOrder(values);
  std::vector<double> ranks(values.size(), 0.0);

  std::size_t i = 0;
  while (i < order.size()) {
    std::size_t j = i;
    while (j + 1 < order.size() && values[order[j + 1]] == values[order[i]]) {
      ++j;
    }
    // positions i..j (0-based) share rank mean((i+1)..(j+1))
    const double avg = (static_cast<double>(i + 1) + static_cast<double>(j + 1)) / 2.0;
    for (std::size_t k = i; k <= j; ++k) {
      ranks[order[k]] = avg;
    }
    i = j + 1;
  }
  return ranks;
}

std::vector<int> MinRanksDescending(const std::vector<double>& values) {
  std::vector<int> ranks(values.size(), 0);
  for (std::size_t i = 0; i < values.size(); ++i) {
    int greater = 0;
    for (double other : values) {
      if (other > values[i]) ++greater;
    }
    ranks[i] = greater + 1;
  }
  return ranks;
}

std::vector<double> PercentileNorm(const std::vector<double>& values) {
  if (values.size() < 2) return std::vector<double>(values.size(), 0.5);

  auto       ranks = AverageRanks(values);
  const auto n     = static_cast<double>(values.size());
  for (auto& r : ranks) {
    r /= n;
  }
  return ranks;
}

std::vector<double> SpanPercentileNorm(const std::vector<double>& values) {
  if (values.size() < 2) return std::vector<double>(values.size(), 0.5);

  auto       ranks = AverageRanks(values);
  const auto m     = static_cast<double>(values.size());
  for (auto& r : ranks) {
    r = (r - 1.0) / (m - 1.0);
  }
  return ranks;
}

std::vector<double> ZScoreSigmoid(const std::vector<double>& values) {
  std::vector<double> out(values.size(), 0.5);
  if (values.size() < 2) return out;

  const double mu = Mean(values);
  const double sd = PopulationSd(values);
  if (sd <= 0.0) return out;

  for (std::size_t i = 0; i < values.size(); ++i) {
    const double z = (values[i] - mu) / sd;
    out[i]         = 1.0 / (1.0 + std::exp(-z));
  }
  return out;
}

std::vector<double> Normalize(const std::vector<double>& values, NormMode mode) {
  switch (mode) {
    case NormMode::kZScore:
      return ZScoreSigmoid(values);
    case NormMode::kPercentile:
      break;
  }
  return PercentileNorm(values);
}

void ClipOutliers(std::vector<double>& values, double z, std::size_t min_count) {
  if (values.size() < min_count) return;

  const double sd = PopulationSd(values);
  if (sd <= 0.0) return;

  const double mu = Mean(values);
  for (auto& v : values) {
    v = Clip(v, mu - z * sd, mu + z * sd);
  }
}

} // namespace powerscore::rating
