#pragma once

#include <optional>
#include <vector>

#include "ledgercore/common/amount.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace telemetry {
class TelemetrySink;
}  // namespace telemetry

namespace ledger {

struct EntryDraft {
  common::TransactionId transaction{0};
  common::AccountId account{0};
  common::Amount debit{};
  common::Amount credit{};
};

struct EntryFilter {
  std::optional<common::TransactionId> transaction;
  std::optional<common::AccountId> account;
};

// Debit/credit exclusivity of a single entry: neither side negative and
// exactly one side strictly positive.
common::Status check_entry_amounts(common::Amount debit, common::Amount credit);

// Write path for ledger entries. Each entry is validated on its own; whether
// the owning transaction balances is a separate read (BalanceQuery), so a
// transaction may be unbalanced between writes.
class EntryValidator {
 public:
  explicit EntryValidator(store::Store& store, telemetry::TelemetrySink* telemetry = nullptr)
      : store_(store), telemetry_(telemetry) {}

  common::Result<store::EntryRow> validate_and_persist(const EntryDraft& draft);
  common::Result<store::EntryRow> update(common::EntryId id, const EntryDraft& draft);
  common::Status remove(common::EntryId id);

  [[nodiscard]] common::Result<store::EntryRow> get(common::EntryId id) const;
  [[nodiscard]] std::vector<store::EntryRow> list(const EntryFilter& filter = {}) const;

 private:
  template <typename T>
  common::Result<T> count(common::Result<T> result) const;

  store::Store& store_;
  telemetry::TelemetrySink* telemetry_;
};

}  // namespace ledger
}  // namespace ledgercore
