#include "gradient_boosting.hpp"

#include <numeric>
#include <random>

#include "internal/ml/sampling.hpp"

namespace powerscore::ml {

GradientBoosting::GradientBoosting(GradientBoostingParams params) : params_(params) {
}

void GradientBoosting::Fit(const Dataset& data) {
  trees_.clear();
  base_ = 0.0;
  if (data.Rows() == 0) return;

  base_ = std::accumulate(data.y.begin(), data.y.end(), 0.0) / static_cast<double>(data.Rows());

  std::mt19937        rng(params_.seed);
  std::vector<double> pred(data.Rows(), base_);
  std::vector<double> residual(data.Rows(), 0.0);

  trees_.reserve(static_cast<std::size_t>(params_.n_estimators));
  for (int m = 0; m < params_.n_estimators; ++m) {
    for (std::size_t i = 0; i < data.Rows(); ++i) {
      residual[i] = data.y[i] - pred[i];
    }

    TreeParams tp;
    tp.max_depth        = params_.max_depth;
    tp.min_samples_leaf = params_.min_samples_leaf;
    tp.reg_lambda       = params_.reg_lambda;
    tp.features         = SampleWithoutReplacement(data.Cols(), params_.colsample, rng);

    const auto rows = SampleWithoutReplacement(data.Rows(), params_.subsample, rng);

    RegressionTree tree(std::move(tp));
    tree.Fit(data, residual, rows);

    for (std::size_t i = 0; i < data.Rows(); ++i) {
      pred[i] += params_.learning_rate * tree.Predict(data.x[i]);
    }
    trees_.push_back(std::move(tree));
  }
}

double GradientBoosting::Predict(const std::vector<double>& row) const {
  double out = base_;
  for (const auto& tree : trees_) {
    out += params_.learning_rate * tree.Predict(row);
  }
  return out;
}

} // namespace powerscore::ml
