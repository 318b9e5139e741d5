#include "ledgercore/ledger/ledger_book.hpp"

#include <algorithm>
#include <map>
#include <tuple>

#include "ledgercore/common/time_utils.hpp"

namespace ledgercore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeInvalidDigits = 2201;
constexpr std::uint16_t kRejectCodeInvalidRange = 2202;
constexpr std::uint16_t kRejectCodeTotalsOverflow = 2203;

bool in_range(common::Date day, const GeneralLedgerQuery& query) {
  return (!query.from || day >= *query.from) && (!query.to || day <= *query.to);
}

// total += amount; false and total untouched on overflow.
bool accumulate(common::Amount& total, common::Amount amount) {
  const auto sum = common::checked_add(total, amount);
  if (!sum) {
    return false;
  }
  total = *sum;
  return true;
}

}  // namespace

std::string LedgerBook::major_code(const std::string& account_code, int digits) {
  const auto width = static_cast<std::size_t>(digits);
  if (account_code.size() >= width) {
    return account_code.substr(0, width);
  }
  std::string padded = account_code;
  padded.append(width - account_code.size(), '0');
  return padded;
}

std::vector<JournalLine> LedgerBook::journal(std::optional<common::PeriodId> period) const {
  auto lines = store_.read([&](const store::Tables& tables) {
    std::vector<JournalLine> out;
    tables.entries.for_each([&](const store::EntryRow& entry) {
      const auto* transaction = tables.transactions.find(entry.transaction);
      const auto* account = tables.accounts.find(entry.account);
      if (!transaction || !account) {
        return;
      }
      if (period && transaction->period != *period) {
        return;
      }
      out.push_back(JournalLine{
          .transaction = transaction->id,
          .occurred_at = transaction->occurred_at,
          .description = transaction->description,
          .entry = entry.id,
          .account_code = account->code,
          .account_name = account->name,
          .debit = entry.debit,
          .credit = entry.credit,
      });
    });
    return out;
  });

  std::sort(lines.begin(), lines.end(), [](const JournalLine& lhs, const JournalLine& rhs) {
    return std::tie(lhs.occurred_at, lhs.entry) < std::tie(rhs.occurred_at, rhs.entry);
  });
  return lines;
}

common::Result<GeneralLedger> LedgerBook::general_ledger(const GeneralLedgerQuery& query) const {
  using LedgerResult = common::Result<GeneralLedger>;

  if (query.digits < 1 || query.digits > kMaxDigits) {
    return LedgerResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidDigits,
                                                "digits must be between 1 and " + std::to_string(kMaxDigits)));
  }
  if (query.from && query.to && *query.from > *query.to) {
    return LedgerResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidRange,
                                                "start date must not be after end date"));
  }

  const auto overflow = [] {
    return LedgerResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeTotalsOverflow,
                                                "ledger totals exceed the representable range"));
  };

  return store_.read([&](const store::Tables& tables) {
    std::map<common::AccountId, AccountTotals> per_account;
    tables.accounts.for_each([&](const store::AccountRow& account) {
      per_account.emplace(account.id, AccountTotals{
                                          .code = account.code,
                                          .name = account.name,
                                          .classification = account.classification,
                                      });
    });

    bool fits = true;
    tables.entries.for_each([&](const store::EntryRow& entry) {
      const auto* transaction = tables.transactions.find(entry.transaction);
      if (!fits || !transaction || !in_range(common::date_of(transaction->occurred_at), query)) {
        return;
      }
      auto it = per_account.find(entry.account);
      if (it == per_account.end()) {
        return;
      }
      fits = accumulate(it->second.debit, entry.debit) && accumulate(it->second.credit, entry.credit);
    });
    if (!fits) {
      return overflow();
    }

    std::map<std::string, MajorAccount> majors;
    for (auto& [id, totals] : per_account) {
      const auto balance = common::checked_add(totals.debit, -totals.credit);
      if (!balance) {
        return overflow();
      }
      totals.balance = *balance;
      const auto code = major_code(totals.code, query.digits);

      auto [it, inserted] = majors.try_emplace(code);
      auto& major = it->second;
      if (inserted) {
        major.code = code;
        major.name = "Major account " + code;
        tables.accounts.for_each([&](const store::AccountRow& account) {
          if (account.code == code) {
            major.name = account.name;
          }
        });
      }
      if (!accumulate(major.debit, totals.debit) || !accumulate(major.credit, totals.credit) ||
          !accumulate(major.balance, totals.balance)) {
        return overflow();
      }
      if (query.include_detail) {
        major.detail.push_back(totals);
      }
    }

    GeneralLedger ledger;
    ledger.majors.reserve(majors.size());
    for (auto& [code, major] : majors) {
      std::sort(major.detail.begin(), major.detail.end(),
                [](const AccountTotals& lhs, const AccountTotals& rhs) { return lhs.code < rhs.code; });
      if (!accumulate(ledger.summary.total_debit, major.debit) ||
          !accumulate(ledger.summary.total_credit, major.credit)) {
        return overflow();
      }
      ledger.majors.push_back(std::move(major));
    }
    ledger.summary.major_accounts = ledger.majors.size();
    const auto difference = common::checked_add(ledger.summary.total_debit, -ledger.summary.total_credit);
    if (!difference) {
      return overflow();
    }
    ledger.summary.difference = difference->is_negative() ? -*difference : *difference;
    return LedgerResult::success(std::move(ledger));
  });
}

}  // namespace ledger
}  // namespace ledgercore
