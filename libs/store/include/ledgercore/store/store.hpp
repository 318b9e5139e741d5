#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/change_set.hpp"

namespace ledgercore {
namespace telemetry {
class TelemetrySink;
}  // namespace telemetry

namespace store {

// Reject codes raised by the store itself while committing.
namespace codes {
inline constexpr std::uint16_t kUnitFinished = 4001;
inline constexpr std::uint16_t kVersionConflict = 4002;

inline constexpr std::uint16_t kMissingPeriod = 4101;
inline constexpr std::uint16_t kMissingTransaction = 4102;
inline constexpr std::uint16_t kMissingAccount = 4103;
inline constexpr std::uint16_t kMissingClient = 4104;
inline constexpr std::uint16_t kMissingInvoice = 4105;
inline constexpr std::uint16_t kMissingProduct = 4106;

inline constexpr std::uint16_t kDuplicateAccountCode = 4201;
inline constexpr std::uint16_t kDuplicateProductCode = 4202;
inline constexpr std::uint16_t kDuplicateClientTaxId = 4203;
inline constexpr std::uint16_t kDuplicateInvoiceNumber = 4204;

inline constexpr std::uint16_t kPeriodReferenced = 4301;
inline constexpr std::uint16_t kAccountReferenced = 4302;
inline constexpr std::uint16_t kTransactionHasEntries = 4303;
inline constexpr std::uint16_t kTransactionInvoiced = 4304;
inline constexpr std::uint16_t kProductReferenced = 4305;
inline constexpr std::uint16_t kClientReferenced = 4306;
inline constexpr std::uint16_t kInvoiceHasLines = 4307;
}  // namespace codes

// Parent rows that can be used as a serialization point.
enum class LockScope : std::uint8_t {
  kTransaction,
  kInvoice,
};

// Exclusive hold on one parent row; released on destruction.
class RowLock {
 public:
  explicit RowLock(std::shared_ptr<std::mutex> mutex)
      : mutex_(std::move(mutex)), lock_(*mutex_) {}

  RowLock(RowLock&&) noexcept = default;
  RowLock& operator=(RowLock&&) = delete;

 private:
  std::shared_ptr<std::mutex> mutex_;
  std::unique_lock<std::mutex> lock_;
};

class LockTable {
 public:
  [[nodiscard]] RowLock acquire(LockScope scope, const std::string& key);

 private:
  static constexpr std::size_t kSweepThreshold = 4096;

  std::mutex mutex_;
  std::map<std::pair<LockScope, std::string>, std::weak_ptr<std::mutex>> rows_{};
};

class Store {
 public:
  using JournalListener = std::function<void(const ChangeSet&)>;
  using Guard = std::function<common::Status(const CommitView&)>;

  explicit Store(common::ConcurrencyMode mode = common::ConcurrencyMode::kLocking);
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  [[nodiscard]] common::ConcurrencyMode mode() const noexcept { return mode_; }

  // Called under the commit lock with every non-empty change set, before it
  // is applied. A throwing listener aborts the commit.
  void set_journal_listener(JournalListener listener);
  void set_telemetry(telemetry::TelemetrySink* sink) noexcept { telemetry_ = sink; }

  // Read-committed access to all tables.
  template <typename Fn>
  auto read(Fn&& fn) const {
    std::shared_lock lock(mutex_);
    return fn(static_cast<const Tables&>(tables_));
  }

  template <typename Row>
  [[nodiscard]] KeyOf<Row> next_id() {
    return static_cast<KeyOf<Row>>(sequences_[sequence_index<Row>()].fetch_add(1, std::memory_order_relaxed) + 1);
  }

  // Applies a journaled change set without running guards.
  void replay(const ChangeSet& changes);

  [[nodiscard]] RowLock lock_row(LockScope scope, const std::string& key) { return locks_.acquire(scope, key); }

 private:
  friend class UnitOfWork;

  static constexpr std::size_t kSequenceCount = 7;

  template <typename Row>
  static constexpr std::size_t sequence_index() {
    static_assert(!std::is_same_v<Row, InvoiceRow>, "invoice ids are tokens, not sequences");
    if constexpr (std::is_same_v<Row, AccountRow>) {
      return 0;
    } else if constexpr (std::is_same_v<Row, PeriodRow>) {
      return 1;
    } else if constexpr (std::is_same_v<Row, TransactionRow>) {
      return 2;
    } else if constexpr (std::is_same_v<Row, EntryRow>) {
      return 3;
    } else if constexpr (std::is_same_v<Row, ProductRow>) {
      return 4;
    } else if constexpr (std::is_same_v<Row, ClientRow>) {
      return 5;
    } else {
      static_assert(std::is_same_v<Row, InvoiceLineRow>);
      return 6;
    }
  }

  common::Status commit(const ChangeSet& changes, const std::vector<Guard>& guards);
  void advance_sequence(std::size_t index, std::uint64_t seen) noexcept;

  const common::ConcurrencyMode mode_;
  mutable std::shared_mutex mutex_;
  Tables tables_{};
  LockTable locks_{};
  std::array<std::atomic<std::uint64_t>, kSequenceCount> sequences_{};
  JournalListener journal_{};
  telemetry::TelemetrySink* telemetry_{nullptr};
};

}  // namespace store
}  // namespace ledgercore
