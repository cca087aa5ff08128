#pragma once

#include <cstddef>
#include <vector>

#include "internal/ml/regressor.hpp"

namespace powerscore::ml {

struct TreeParams {
  int    max_depth        = 5;
  int    min_samples_leaf = 1;
  double reg_lambda       = 0.0; // L2 on leaf values; 0 gives plain means

  // Candidate split columns; empty means every column.
  std::vector<std::size_t> features;
};

/*
  RegressionTree

  Squared-error CART grown depth-first. A split is kept only when it
  improves the regularized score and leaves min_samples_leaf rows on
  both sides. Thresholds sit halfway between adjacent distinct values.
*/
class RegressionTree {
 public:
  explicit RegressionTree(TreeParams params);

  // Fits on data rows listed in `rows` (duplicates allowed for bootstrap).
  void Fit(const Dataset& data, const std::vector<double>& targets, const std::vector<std::size_t>& rows);

  double Predict(const std::vector<double>& row) const;

  std::size_t NodeCount() const {
    return nodes_.size();
  }

  int Depth() const;

 private:
  struct Node {
    int    feature   = -1; // -1 marks a leaf
    double threshold = 0.0;
    int    left      = -1;
    int    right     = -1;
    double value     = 0.0;
  };

  struct Split {
    int    feature   = -1;
    double threshold = 0.0;
    double gain      = 0.0;
  };

  int   Build(const Dataset& data, const std::vector<double>& targets, std::vector<std::size_t>& rows, int depth);
  Split FindSplit(const Dataset& data, const std::vector<double>& targets, const std::vector<std::size_t>& rows) const;
  int   DepthFrom(int node) const;

  TreeParams        params_;
  std::vector<Node> nodes_;
};

} // namespace powerscore::ml
