#include "regression_tree.hpp"

#include <algorithm>
#include <numeric>

namespace powerscore::ml {

namespace {

constexpr double kMinGain = 1e-12;

double Score(double sum, double count, double lambda) {
  return sum * sum / (count + lambda);
}

} // namespace

RegressionTree::RegressionTree(TreeParams params) : params_(std::move(params)) {
}

void RegressionTree::Fit(const Dataset& data, const std::vector<double>& targets, const std::vector<std::size_t>& rows) {
  nodes_.clear();
  if (params_.features.empty()) {
    params_.features.resize(data.Cols());
    std::iota(params_.features.begin(), params_.features.end(), std::size_t{0});
  }

  auto work = rows;
  Build(data, targets, work, 0);
}

int RegressionTree::Build(const Dataset& data, const std::vector<double>& targets, std::vector<std::size_t>& rows, int depth) {
  double sum = 0.0;
  for (auto r : rows) {
    sum += targets[r];
  }

  const int index = static_cast<int>(nodes_.size());
  nodes_.push_back({});
  nodes_[index].value = rows.empty() ? 0.0 : sum / (static_cast<double>(rows.size()) + params_.reg_lambda);

  const auto min_leaf = static_cast<std::size_t>(std::max(1, params_.min_samples_leaf));
  if (depth >= params_.max_depth || rows.size() < 2 * min_leaf) {
    return index;
  }

  const auto split = FindSplit(data, targets, rows);
  if (split.feature < 0) {
    return index;
  }

  const auto f   = static_cast<std::size_t>(split.feature);
  auto       mid = std::stable_partition(rows.begin(), rows.end(), [&](std::size_t r) { return data.x[r][f] <= split.threshold; });

  std::vector<std::size_t> left(rows.begin(), mid);
  std::vector<std::size_t> right(mid, rows.end());

  nodes_[index].feature   = split.feature;
  nodes_[index].threshold = split.threshold;

  // nodes_ may reallocate while children are built.
  const int l         = Build(data, targets, left, depth + 1);
  nodes_[index].left  = l;
  const int r         = Build(data, targets, right, depth + 1);
  nodes_[index].right = r;
  return index;
}

RegressionTree::Split RegressionTree::FindSplit(const Dataset& data, const std::vector<double>& targets,
                                                const std::vector<std::size_t>& rows) const {
  const double lambda   = params_.reg_lambda;
  const auto   min_leaf = static_cast<std::size_t>(std::max(1, params_.min_samples_leaf));
  const auto   n        = static_cast<double>(rows.size());

  double total = 0.0;
  for (auto r : rows) {
    total += targets[r];
  }
  const double parent = Score(total, n, lambda);

  Split                    best;
  std::vector<std::size_t> order(rows);
  for (auto f : params_.features) {
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return data.x[a][f] < data.x[b][f]; });

    double left_sum = 0.0;
    for (std::size_t i = 0; i + 1 < order.size(); ++i) {
      left_sum += targets[order[i]];

      const std::size_t left_n = i + 1;
      if (left_n < min_leaf || order.size() - left_n < min_leaf) continue;

      const double lo = data.x[order[i]][f];
      const double hi = data.x[order[i + 1]][f];
      if (lo == hi) continue;

      const double gain = Score(left_sum, static_cast<double>(left_n), lambda) +
                          Score(total - left_sum, static_cast<double>(order.size() - left_n), lambda) - parent;
      if (gain > best.gain + kMinGain) {
        best.feature   = static_cast<int>(f);
        best.threshold = lo + (hi - lo) / 2.0;
        best.gain      = gain;
      }
    }
  }
  return best;
}

double RegressionTree::Predict(const std::vector<double>& row) const {
  if (nodes_.empty()) return 0.0;

  int i = 0;
  while (nodes_[static_cast<std::size_t>(i)].feature >= 0) {
    const auto& node = nodes_[static_cast<std::size_t>(i)];
    i                = row[static_cast<std::size_t>(node.feature)] <= node.threshold ? node.left : node.right;
  }
  return nodes_[static_cast<std::size_t>(i)].value;
}

int RegressionTree::Depth() const {
  return nodes_.empty() ? 0 : DepthFrom(0);
}

int RegressionTree::DepthFrom(int node) const {
  const auto& n = nodes_[static_cast<std::size_t>(node)];
  if (n.feature < 0) return 0;
  return 1 + std::max(DepthFrom(n.left), DepthFrom(n.right));
}

} // namespace powerscore::ml
