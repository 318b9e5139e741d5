#pragma once

#include "ledgercore/common/amount.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace ledger {

struct Balance {
  common::Amount total_debit{};
  common::Amount total_credit{};
  bool is_balanced{true};
};

// Advisory read: never invoked on the write path.
class BalanceQuery {
 public:
  explicit BalanceQuery(const store::Store& store) : store_(store) {}

  [[nodiscard]] common::Result<Balance> compute_balance(common::TransactionId id) const;

 private:
  const store::Store& store_;
};

}  // namespace ledger
}  // namespace ledgercore
