#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "ledgercore/common/status.hpp"
#include "ledgercore/store/change_set.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace store {

// One atomic unit of work against a Store. Reads see committed rows with this
// unit's own staged writes laid over them; nothing is visible to other readers
// until commit() applies everything at once. Destroying an uncommitted unit
// rolls it back and releases its row locks.
class UnitOfWork {
 public:
  explicit UnitOfWork(Store& store) : store_(store) {}
  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;
  UnitOfWork(UnitOfWork&&) = delete;
  UnitOfWork& operator=(UnitOfWork&&) = delete;
  ~UnitOfWork() { rollback(); }

  template <typename Row>
  [[nodiscard]] std::optional<Row> get(const KeyOf<Row>& key) const {
    const auto& changes = staged_.of<Row>();
    if (auto it = changes.find(key); it != changes.end()) {
      return it->second;
    }
    return store_.read([&](const Tables& tables) -> std::optional<Row> {
      if (const Row* row = tables.of<Row>().find(key)) {
        return *row;
      }
      return std::nullopt;
    });
  }

  template <typename Row>
  [[nodiscard]] bool contains(const KeyOf<Row>& key) const {
    return get<Row>(key).has_value();
  }

  // Rows matching pred, ordered by key.
  template <typename Row, typename Pred>
  [[nodiscard]] std::vector<Row> select(Pred&& pred) const {
    auto merged = store_.read([&](const Tables& tables) {
      std::map<KeyOf<Row>, Row> out;
      tables.of<Row>().for_each([&](const Row& row) {
        if (pred(row)) {
          out.emplace(row.id, row);
        }
      });
      return out;
    });
    for (const auto& [key, row] : staged_.of<Row>()) {
      if (row && pred(*row)) {
        merged.insert_or_assign(key, *row);
      } else {
        merged.erase(key);
      }
    }
    std::vector<Row> rows;
    rows.reserve(merged.size());
    for (auto& [key, row] : merged) {
      rows.push_back(std::move(row));
    }
    return rows;
  }

  template <typename Row>
  void put(Row row) {
    auto key = row.id;
    staged_.of<Row>().insert_or_assign(std::move(key), std::optional<Row>{std::move(row)});
  }

  template <typename Row>
  void erase(const KeyOf<Row>& key) {
    staged_.of<Row>().insert_or_assign(key, std::optional<Row>{});
  }

  template <typename Row>
  [[nodiscard]] KeyOf<Row> next_id() {
    return store_.next_id<Row>();
  }

  // Takes the row lock for key until commit or rollback. Re-locking a key this
  // unit already holds is a no-op.
  void lock(LockScope scope, const std::string& key);

  // Fails the commit with ConcurrencyConflict if the committed version of the
  // row changes between now and commit.
  template <typename Row>
  void expect_version(const KeyOf<Row>& key) {
    const auto expected = store_.read([&](const Tables& tables) { return tables.of<Row>().version(key); });
    add_guard([key, expected](const CommitView& view) {
      if (view.committed().of<Row>().version(key) != expected) {
        return common::reject(common::ErrorKind::kConcurrencyConflict, codes::kVersionConflict,
                              "row was modified concurrently, retry the operation");
      }
      return common::ok_status();
    });
  }

  // Per-parent serialization point: a row lock in locking mode, a version
  // check in optimistic mode. Must be called before reading the children.
  template <typename Row>
  void serialize_on(const KeyOf<Row>& key) {
    static_assert(std::is_same_v<Row, TransactionRow> || std::is_same_v<Row, InvoiceRow>);
    if (store_.mode() == common::ConcurrencyMode::kOptimistic) {
      expect_version<Row>(key);
      return;
    }
    if constexpr (std::is_same_v<Row, InvoiceRow>) {
      lock(LockScope::kInvoice, key);
    } else {
      lock(LockScope::kTransaction, std::to_string(key));
    }
  }

  void add_guard(Store::Guard guard) { guards_.push_back(std::move(guard)); }

  [[nodiscard]] common::Status commit();
  void rollback() noexcept;

  [[nodiscard]] bool finished() const noexcept { return finished_; }
  [[nodiscard]] const ChangeSet& staged() const noexcept { return staged_; }
  [[nodiscard]] common::ConcurrencyMode mode() const noexcept { return store_.mode(); }

 private:
  Store& store_;
  ChangeSet staged_{};
  std::vector<Store::Guard> guards_{};
  std::vector<RowLock> locks_{};
  std::set<std::pair<LockScope, std::string>> held_{};
  bool finished_{false};
};

}  // namespace store
}  // namespace ledgercore
