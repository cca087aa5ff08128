#pragma once

#include "config/config.pb.h"
#include "internal/rating/settings.hpp"

namespace powerscore::config {

/*
  Semantic validation of a parsed RuntimeConfig.

  Every rating constant is required (proto3 presence), weights must
  sum to 1.0 and ranges are checked. All violations are collected and
  raised together as util::InvalidConfig before any computation runs.
*/
class ConfigValidator {
 public:
  static void Validate(const powerscore::runtime::config::RuntimeConfig& config);

  // Validates, then converts the rating section into engine settings.
  static rating::Settings BuildSettings(const powerscore::runtime::config::RuntimeConfig& config);
};

} // namespace powerscore::config
