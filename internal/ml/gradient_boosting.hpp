#pragma once

#include <cstdint>
#include <vector>

#include "internal/ml/regression_tree.hpp"
#include "internal/ml/regressor.hpp"

namespace powerscore::ml {

struct GradientBoostingParams {
  int           n_estimators     = 220;
  int           max_depth        = 5;
  double        learning_rate    = 0.08;
  double        subsample        = 0.9;
  double        colsample        = 0.9;
  double        reg_lambda       = 1.0;
  int           min_samples_leaf = 1;
  std::uint32_t seed             = 42;
};

/*
  Squared-error gradient boosting.

  Starts from the target mean; each round fits a tree to the current
  residuals on a row subsample and a column subsample drawn from one
  seeded generator, then adds learning_rate times its output.
*/
class GradientBoosting final : public Regressor {
 public:
  explicit GradientBoosting(GradientBoostingParams params);

  void   Fit(const Dataset& data) override;
  double Predict(const std::vector<double>& row) const override;

  std::string_view Name() const override {
    return "gradient_boosting";
  }

  std::size_t TreeCount() const {
    return trees_.size();
  }

 private:
  GradientBoostingParams      params_;
  double                      base_ = 0.0;
  std::vector<RegressionTree> trees_;
};

} // namespace powerscore::ml
