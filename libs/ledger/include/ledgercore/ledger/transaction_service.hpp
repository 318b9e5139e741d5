#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ledgercore/common/paging.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace ledger {

struct TransactionOptions {
  std::string default_currency{"USD"};
  common::DeletionPolicy delete_policy{common::DeletionPolicy::kReject};
};

struct TransactionDraft {
  common::Timestamp occurred_at{};
  std::string description;
  common::TransactionKind kind{common::TransactionKind::kIncome};
  std::optional<std::string> currency;  // configured default when absent
  std::string created_by;
  common::PeriodId period{0};
};

struct TransactionFilter {
  std::optional<common::Date> from;
  std::optional<common::Date> to;
  std::optional<common::PeriodId> period;
  std::optional<common::TransactionKind> kind;
  common::Page page{};
};

// Transaction headers. Entries are attached afterwards through the
// EntryValidator; a header never checks its own balance.
class TransactionService {
 public:
  explicit TransactionService(store::Store& store, TransactionOptions options = {});

  common::Result<store::TransactionRow> create(const TransactionDraft& draft);
  common::Result<store::TransactionRow> update(common::TransactionId id, const TransactionDraft& draft);

  // Uses the configured deletion policy.
  common::Status remove(common::TransactionId id);
  // kReject fails while entries exist; kCascade deletes them in the same unit of work.
  common::Status remove(common::TransactionId id, common::DeletionPolicy policy);

  [[nodiscard]] common::Result<store::TransactionRow> get(common::TransactionId id) const;
  [[nodiscard]] std::vector<store::TransactionRow> list(const TransactionFilter& filter = {}) const;

  [[nodiscard]] const TransactionOptions& options() const noexcept { return options_; }

 private:
  store::Store& store_;
  TransactionOptions options_;
};

}  // namespace ledger
}  // namespace ledgercore
