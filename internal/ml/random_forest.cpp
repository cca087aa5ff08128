#include "random_forest.hpp"

#include <random>

#include "internal/ml/sampling.hpp"

namespace powerscore::ml {

RandomForest::RandomForest(RandomForestParams params) : params_(params) {
}

void RandomForest::Fit(const Dataset& data) {
  trees_.clear();
  if (data.Rows() == 0) return;

  std::mt19937 rng(params_.seed);
  trees_.reserve(static_cast<std::size_t>(params_.n_estimators));
  for (int m = 0; m < params_.n_estimators; ++m) {
    TreeParams tp;
    tp.max_depth        = params_.max_depth;
    tp.min_samples_leaf = params_.min_samples_leaf;
    tp.reg_lambda       = 0.0;
    tp.features         = SampleWithoutReplacement(data.Cols(), params_.max_features, rng);

    const auto rows = Bootstrap(data.Rows(), rng);

    RegressionTree tree(std::move(tp));
    tree.Fit(data, data.y, rows);
    trees_.push_back(std::move(tree));
  }
}

double RandomForest::Predict(const std::vector<double>& row) const {
  if (trees_.empty()) return 0.0;

  double sum = 0.0;
  for (const auto& tree : trees_) {
    sum += tree.Predict(row);
  }
  return sum / static_cast<double>(trees_.size());
}

} // namespace powerscore::ml
