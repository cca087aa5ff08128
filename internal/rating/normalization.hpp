#pragma once

#include <vector>

#include "internal/rating/settings.hpp"

namespace powerscore::rating {

double Clip(double value, double lo, double hi);

double Mean(const std::vector<double>& values);

// Population standard deviation (divides by n).
double PopulationSd(const std::vector<double>& values);

// 1-based ascending ranks; ties share the average of their positions.
std::vector<double> AverageRanks(const std::vector<double>& values);

// 1-based descending ranks; ties share the lowest position.
std::vector<int> MinRanksDescending(const std::vector<double>& values);

// average_rank / n, in (0,1]. Fewer than two values give 0.5.
std::vector<double> PercentileNorm(const std::vector<double>& values);

// (average_rank - 1) / (n - 1), in [0,1]. Fewer than two values give 0.5.
std::vector<double> SpanPercentileNorm(const std::vector<double>& values);

// 1/(1+exp(-z)). Zero spread or fewer than two values give 0.5.
std::vector<double> ZScoreSigmoid(const std::vector<double>& values);

std::vector<double> Normalize(const std::vector<double>& values, NormMode mode);

// Clips each value to mean +- z*sd; needs min_count values and sd > 0.
void ClipOutliers(std::vector<double>& values, double z, std::size_t min_count = 3);

} // namespace powerscore::rating
