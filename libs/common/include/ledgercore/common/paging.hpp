#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <vector>

namespace ledgercore {
namespace common {

struct Page {
  std::size_t offset{0};
  std::size_t limit{100};
};

template <typename T>
std::vector<T> slice(std::vector<T> rows, Page page) {
  if (page.offset >= rows.size()) {
    return {};
  }
  const auto first = rows.begin() + static_cast<std::ptrdiff_t>(page.offset);
  const auto count = std::min(page.limit, rows.size() - page.offset);
  return std::vector<T>(std::make_move_iterator(first),
                        std::make_move_iterator(first + static_cast<std::ptrdiff_t>(count)));
}

}  // namespace common
}  // namespace ledgercore
