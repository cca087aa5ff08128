#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace powerscore::util {

/*
  Central error types.

  Thrown at the API edge (config load, CLI, pipeline setup).
  Repository code reports failures through db::Result instead.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Raised once per load with every violation found, so an operator
  can fix the whole file in one pass.
*/
class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(std::vector<std::string> violations)
      : std::runtime_error(Join(violations)), violations_(std::move(violations)) {
  }

  const std::vector<std::string>& Violations() const {
    return violations_;
  }

 private:
  static std::string Join(const std::vector<std::string>& violations) {
    std::string out = "invalid configuration:";
    for (const auto& v : violations) {
      out += "\n  - " + v;
    }
    return out;
  }

  std::vector<std::string> violations_;
};

} // namespace powerscore::util
