#include "ledgercore/ledger/balance_query.hpp"

namespace ledgercore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeUnknownTransaction = 2301;
constexpr std::uint16_t kRejectCodeBalanceOverflow = 2302;
}  // namespace

common::Result<Balance> BalanceQuery::compute_balance(common::TransactionId id) const {
  using BalanceResult = common::Result<Balance>;

  return store_.read([id](const store::Tables& tables) {
    if (!tables.transactions.find(id)) {
      return BalanceResult::failure(common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownTransaction,
                                                   "transaction " + std::to_string(id) + " does not exist"));
    }

    Balance balance;
    bool overflow = false;
    tables.entries.for_each([&](const store::EntryRow& entry) {
      if (overflow || entry.transaction != id) {
        return;
      }
      const auto debit = common::checked_add(balance.total_debit, entry.debit);
      const auto credit = common::checked_add(balance.total_credit, entry.credit);
      if (!debit || !credit) {
        overflow = true;
        return;
      }
      balance.total_debit = *debit;
      balance.total_credit = *credit;
    });
    if (overflow) {
      return BalanceResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeBalanceOverflow,
                                                   "totals of transaction " + std::to_string(id) +
                                                       " exceed the representable range"));
    }
    balance.is_balanced = balance.total_debit == balance.total_credit;
    return BalanceResult::success(balance);
  });
}

}  // namespace ledger
}  // namespace ledgercore
