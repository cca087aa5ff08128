#pragma once

#include <cstddef>
#include <vector>

namespace powerscore::rating {

/*
  Disjoint sets over dense integer node indices.
  Path halving plus union by size.
*/
class UnionFind {
 public:
  explicit UnionFind(std::size_t n);

  std::size_t Find(std::size_t x);
  void        Union(std::size_t a, std::size_t b);

  std::size_t SizeOf(std::size_t x) {
    return size_[Find(x)];
  }

 private:
  std::vector<std::size_t> parent_;
  std::vector<std::size_t> size_;
};

} // namespace powerscore::rating
