#include "internal/rating/normalization.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

namespace {

using namespace powerscore::rating;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

void TestAverageRanksShareTies() {
  auto ranks = AverageRanks({3.0, 1.0, 3.0, 2.0});
  assert(Near(ranks[0], 3.5));
  assert(Near(ranks[1], 1.0));
  assert(Near(ranks[2], 3.5));
  assert(Near(ranks[3], 2.0));
}

void TestMinRanksDescending() {
  auto ranks = MinRanksDescending({0.9, 0.5, 0.9, 0.1});
  assert(ranks[0] == 1 && ranks[2] == 1);
  assert(ranks[1] == 3);
  assert(ranks[3] == 4);
}

void TestPercentileNormBounds() {
  auto norm = PercentileNorm({10.0, 20.0, 30.0, 40.0});
  assert(Near(norm[0], 0.25));
  assert(Near(norm[3], 1.0));

  auto single = PercentileNorm({7.0});
  assert(Near(single[0], 0.5));

  auto span = SpanPercentileNorm({10.0, 20.0, 30.0});
  assert(Near(span[0], 0.0));
  assert(Near(span[1], 0.5));
  assert(Near(span[2], 1.0));
}

void TestZScoreSigmoidFlatCohortIsMidpoint() {
  auto flat = ZScoreSigmoid({2.0, 2.0, 2.0});
  for (double v : flat) assert(Near(v, 0.5));

  auto spread = Normalize({1.0, 2.0, 3.0}, NormMode::kZScore);
  assert(Near(spread[1], 0.5));
  assert(spread[0] < 0.5 && spread[2] > 0.5);
  assert(Near(spread[0] + spread[2], 1.0));
}

void TestClipOutliersNeedsMinimumCount() {
  std::vector<double> two = {0.0, 100.0};
  ClipOutliers(two, 1.0);
  assert(Near(two[1], 100.0));

  std::vector<double> values = {0.0, 0.0, 0.0, 0.0, 20.0};
  ClipOutliers(values, 1.0);
  const double mu = 4.0;
  const double sd = 8.0;
  assert(Near(values[4], mu + sd));
  assert(Near(values[0], 0.0));
}

} // namespace

int main() {
  TestAverageRanksShareTies();
  TestMinRanksDescending();
  TestPercentileNormBounds();
  TestZScoreSigmoidFlatCohortIsMidpoint();
  TestClipOutliersNeedsMinimumCount();

  std::cout << "normalization_test: pass\n";
  return 0;
}
