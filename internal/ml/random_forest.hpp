#pragma once

#include <cstdint>
#include <vector>

#include "internal/ml/regression_tree.hpp"
#include "internal/ml/regressor.hpp"

namespace powerscore::ml {

struct RandomForestParams {
  int           n_estimators     = 240;
  int           max_depth        = 18;
  int           min_samples_leaf = 2;
  double        max_features     = 1.0; // column fraction per tree
  std::uint32_t seed             = 42;
};

/*
  Bagged regression trees; prediction is the mean over trees.
*/
class RandomForest final : public Regressor {
 public:
  explicit RandomForest(RandomForestParams params);

  void   Fit(const Dataset& data) override;
  double Predict(const std::vector<double>& row) const override;

  std::string_view Name() const override {
    return "random_forest";
  }

 private:
  RandomForestParams          params_;
  std::vector<RegressionTree> trees_;
};

} // namespace powerscore::ml
