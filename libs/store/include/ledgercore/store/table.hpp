#pragma once

#include <cstdint>
#include <map>
#include <utility>

#include "ledgercore/store/rows.hpp"

namespace ledgercore {
namespace store {

// Ordered row map with a per-row write version. A version is 0 while the
// row is absent and increments on every committed write.
template <typename Row>
class Table {
 public:
  using Key = KeyOf<Row>;

  struct Slot {
    Row row{};
    std::uint64_t version{0};
  };

  [[nodiscard]] const Row* find(const Key& key) const {
    auto it = rows_.find(key);
    if (it == rows_.end()) {
      return nullptr;
    }
    return &it->second.row;
  }

  [[nodiscard]] std::uint64_t version(const Key& key) const {
    auto it = rows_.find(key);
    return it == rows_.end() ? 0 : it->second.version;
  }

  void put(Row row) {
    auto& slot = rows_[row.id];
    slot.row = std::move(row);
    ++slot.version;
  }

  bool erase(const Key& key) { return rows_.erase(key) > 0; }

  [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }

  template <typename Fn>
  void for_each(Fn&& fn) const {
    for (const auto& [key, slot] : rows_) {
      fn(slot.row);
    }
  }

  void clear() noexcept { rows_.clear(); }

 private:
  std::map<Key, Slot> rows_{};
};

}  // namespace store
}  // namespace ledgercore
