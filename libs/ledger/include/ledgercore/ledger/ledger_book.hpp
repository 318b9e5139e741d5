#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ledgercore/common/amount.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace ledger {

// One row of the chronological journal: an entry joined with its
// transaction and account.
struct JournalLine {
  common::TransactionId transaction{0};
  common::Timestamp occurred_at{};
  std::string description;
  common::EntryId entry{0};
  std::string account_code;
  std::string account_name;
  common::Amount debit{};
  common::Amount credit{};
};

struct GeneralLedgerQuery {
  int digits{1};  // length of the major-account prefix, 1..10
  std::optional<common::Date> from;
  std::optional<common::Date> to;
  bool include_detail{false};
};

struct AccountTotals {
  std::string code;
  std::string name;
  common::AccountClass classification{common::AccountClass::kAsset};
  common::Amount debit{};
  common::Amount credit{};
  common::Amount balance{};  // debit - credit
};

struct MajorAccount {
  std::string code;
  std::string name;
  common::Amount debit{};
  common::Amount credit{};
  common::Amount balance{};
  std::vector<AccountTotals> detail;  // filled only when include_detail is set
};

struct LedgerSummary {
  std::size_t major_accounts{0};
  common::Amount total_debit{};
  common::Amount total_credit{};
  common::Amount difference{};  // |total_debit - total_credit|
};

struct GeneralLedger {
  std::vector<MajorAccount> majors;
  LedgerSummary summary;
};

// Read-only reports over the ledger tables for the reporting collaborators.
class LedgerBook {
 public:
  static constexpr int kMaxDigits = 10;

  explicit LedgerBook(const store::Store& store) : store_(store) {}

  // Ordered by transaction time, then entry id.
  [[nodiscard]] std::vector<JournalLine> journal(std::optional<common::PeriodId> period = std::nullopt) const;

  // Per-account totals grouped by the first `digits` characters of the account
  // code (shorter codes are right-padded with '0'). Every account appears,
  // with zero totals when it has no movements in range.
  [[nodiscard]] common::Result<GeneralLedger> general_ledger(const GeneralLedgerQuery& query) const;

  [[nodiscard]] static std::string major_code(const std::string& account_code, int digits);

 private:
  const store::Store& store_;
};

}  // namespace ledger
}  // namespace ledgercore
