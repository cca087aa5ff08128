#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace powerscore::ml {

/*
  Dense training data: x[row][feature], y[row].
*/
struct Dataset {
  std::vector<std::vector<double>> x;
  std::vector<double>              y;

  std::size_t Rows() const {
    return y.size();
  }

  std::size_t Cols() const {
    return x.empty() ? 0 : x.front().size();
  }
};

/*
  Regressor

  Abstract model used by the predictive layer. Fit() is deterministic
  for a given dataset and seed; Predict() is const and thread-safe.
*/
class Regressor {
 public:
  virtual ~Regressor() = default;

  virtual void   Fit(const Dataset& data)                        = 0;
  virtual double Predict(const std::vector<double>& row) const = 0;

  virtual std::string_view Name() const = 0;

  std::vector<double> PredictAll(const std::vector<std::vector<double>>& rows) const {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
      out.push_back(Predict(r));
    }
    return out;
  }
};

} // namespace powerscore::ml
