#include "test_ledger.hpp"

#include <cassert>

#include "ledgercore/catalog/account_catalog.hpp"
#include "ledgercore/ledger/balance_query.hpp"
#include "ledgercore/ledger/entry_validator.hpp"
#include "ledgercore/ledger/ledger_book.hpp"
#include "ledgercore/ledger/transaction_service.hpp"
#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"
#include "test_fixtures.hpp"

namespace ledgercore::tests {

void test_entry_exclusivity() {
  assert(ledger::check_entry_amounts(money("50.00"), money("0.00")).ok());
  assert(ledger::check_entry_amounts(money("0.00"), money("0.01")).ok());

  auto both = ledger::check_entry_amounts(money("50.00"), money("10.00"));
  assert(both.kind == common::ErrorKind::kConstraintViolation);
  assert(both.reject_code == 2102);

  auto neither = ledger::check_entry_amounts(money("0.00"), money("0.00"));
  assert(neither.kind == common::ErrorKind::kConstraintViolation);
  assert(neither.reject_code == 2101);

  auto negative = ledger::check_entry_amounts(money("-5.00"), money("0.00"));
  assert(negative.kind == common::ErrorKind::kConstraintViolation);
  assert(negative.reject_code == 2103);

  store::Store store;
  telemetry::TelemetrySink sink;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto transaction = seed_transaction(store, period);
  ledger::EntryValidator entries{store, &sink};

  auto accepted = entries.validate_and_persist(
      {.transaction = transaction, .account = cash, .debit = money("50.00"), .credit = money("0.00")});
  assert(accepted.ok());
  auto stored = entries.get(accepted.value->id);
  assert(stored.ok());
  assert(*stored.value == *accepted.value);

  auto rejected = entries.validate_and_persist(
      {.transaction = transaction, .account = cash, .debit = money("50.00"), .credit = money("10.00")});
  assert(rejected.status.kind == common::ErrorKind::kConstraintViolation);
  assert(entries.list({.transaction = transaction}).size() == 1);

  auto counters = sink.drain_counters();
  assert(counters[telemetry::metrics::kEntriesAccepted] == 1);
  assert(counters[telemetry::metrics::kEntriesRejected] == 1);
}

void test_entry_references() {
  store::Store store;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto transaction = seed_transaction(store, period);
  ledger::EntryValidator entries{store};

  auto no_transaction = entries.validate_and_persist(
      {.transaction = transaction + 100, .account = cash, .debit = money("1.00"), .credit = {}});
  assert(no_transaction.status.kind == common::ErrorKind::kNotFound);
  assert(no_transaction.status.reject_code == 2104);

  auto no_account = entries.validate_and_persist(
      {.transaction = transaction, .account = cash + 100, .debit = money("1.00"), .credit = {}});
  assert(no_account.status.kind == common::ErrorKind::kNotFound);
  assert(no_account.status.reject_code == 2105);

  assert(entries.list().empty());
}

void test_entry_update_and_remove() {
  store::Store store;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto sales = seed_account(store, "4101", "Sales", common::AccountClass::kIncome);
  const auto first = seed_transaction(store, period);
  const auto second = seed_transaction(store, period);
  ledger::EntryValidator entries{store};

  auto entry =
      entries.validate_and_persist({.transaction = first, .account = cash, .debit = money("80.00"), .credit = {}});
  assert(entry.ok());

  auto moved = entries.update(entry.value->id,
                              {.transaction = second, .account = sales, .debit = {}, .credit = money("80.00")});
  assert(moved.ok());
  assert(moved.value->transaction == second);
  assert(entries.list({.transaction = first}).empty());
  assert(entries.list({.account = sales}).size() == 1);

  auto invalid = entries.update(entry.value->id,
                                {.transaction = second, .account = sales, .debit = money("1.00"), .credit = money("1.00")});
  assert(invalid.status.kind == common::ErrorKind::kConstraintViolation);
  assert(entries.get(entry.value->id).value->credit == money("80.00"));

  assert(entries.remove(entry.value->id).ok());
  assert(entries.get(entry.value->id).status.kind == common::ErrorKind::kNotFound);
  assert(entries.remove(entry.value->id).kind == common::ErrorKind::kNotFound);
}

void test_balance_query() {
  store::Store store;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto sales = seed_account(store, "4101", "Sales", common::AccountClass::kIncome);
  const auto tax = seed_account(store, "2105", "Sales tax payable", common::AccountClass::kLiability);
  const auto transaction = seed_transaction(store, period);
  ledger::EntryValidator entries{store};
  ledger::BalanceQuery balances{store};

  assert(entries.validate_and_persist({.transaction = transaction, .account = cash, .debit = money("100"), .credit = {}})
             .ok());

  // A transaction may be unbalanced between writes.
  auto partial = balances.compute_balance(transaction);
  assert(partial.ok());
  assert(!partial.value->is_balanced);
  assert(partial.value->total_debit == money("100"));

  assert(entries.validate_and_persist({.transaction = transaction, .account = sales, .debit = {}, .credit = money("60")})
             .ok());
  assert(entries.validate_and_persist({.transaction = transaction, .account = tax, .debit = {}, .credit = money("40")})
             .ok());

  auto balance = balances.compute_balance(transaction);
  assert(balance.ok());
  assert(balance.value->total_debit == money("100.00"));
  assert(balance.value->total_credit == money("100.00"));
  assert(balance.value->is_balanced);

  auto again = balances.compute_balance(transaction);
  assert(again.value->is_balanced);

  // Debits that fit one by one but not in sum are reported, never wrapped.
  const auto large = seed_transaction(store, period);
  const auto huge = money("90000000000000000.00");
  assert(entries.validate_and_persist({.transaction = large, .account = cash, .debit = huge, .credit = {}}).ok());
  assert(entries.validate_and_persist({.transaction = large, .account = cash, .debit = huge, .credit = {}}).ok());
  auto overflowing = balances.compute_balance(large);
  assert(overflowing.status.kind == common::ErrorKind::kConstraintViolation);
  assert(overflowing.status.reject_code == 2302);

  ledger::LedgerBook book{store};
  auto report = book.general_ledger({});
  assert(report.status.kind == common::ErrorKind::kConstraintViolation);
  assert(report.status.reject_code == 2203);

  auto missing = balances.compute_balance(large + 1);
  assert(missing.status.kind == common::ErrorKind::kNotFound);
}

void test_transaction_lifecycle() {
  store::Store store;
  const auto period = seed_period(store);
  ledger::TransactionService transactions{store, {.default_currency = "CRC"}};

  ledger::TransactionDraft draft{.occurred_at = at(2026, 2, 1),
                                 .description = "Office rent",
                                 .kind = common::TransactionKind::kExpense,
                                 .currency = std::nullopt,
                                 .created_by = "accounting",
                                 .period = period};
  auto created = transactions.create(draft);
  assert(created.ok());
  assert(created.value->currency == "CRC");
  assert(created.value->created_at.time_since_epoch().count() > 0);

  auto bad_period = draft;
  bad_period.period = period + 1;
  assert(transactions.create(bad_period).status.kind == common::ErrorKind::kNotFound);

  auto bad_currency = draft;
  bad_currency.currency = "usd";
  assert(transactions.create(bad_currency).status.kind == common::ErrorKind::kConstraintViolation);

  auto no_description = draft;
  no_description.description.clear();
  assert(transactions.create(no_description).status.kind == common::ErrorKind::kConstraintViolation);

  auto renamed = draft;
  renamed.description = "Office rent, February";
  auto updated = transactions.update(created.value->id, renamed);
  assert(updated.ok());
  assert(transactions.get(created.value->id).value->description == "Office rent, February");

  auto later = draft;
  later.occurred_at = at(2026, 5, 1);
  later.kind = common::TransactionKind::kIncome;
  assert(transactions.create(later).ok());

  auto newest_first = transactions.list();
  assert(newest_first.size() == 2);
  assert(newest_first.front().occurred_at == at(2026, 5, 1));

  auto expenses = transactions.list({.kind = common::TransactionKind::kExpense});
  assert(expenses.size() == 1);
  auto march_on = transactions.list({.from = common::make_date(2026, 3, 1)});
  assert(march_on.size() == 1);
}

void test_transaction_deletion_policy() {
  store::Store store;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto transaction = seed_transaction(store, period);
  ledger::TransactionService transactions{store};
  ledger::EntryValidator entries{store};

  assert(entries.validate_and_persist({.transaction = transaction, .account = cash, .debit = money("5"), .credit = {}})
             .ok());

  auto rejected = transactions.remove(transaction);
  assert(rejected.kind == common::ErrorKind::kReferentialIntegrity);
  assert(transactions.get(transaction).ok());
  assert(entries.list({.transaction = transaction}).size() == 1);

  assert(transactions.remove(transaction, common::DeletionPolicy::kCascade).ok());
  assert(transactions.get(transaction).status.kind == common::ErrorKind::kNotFound);
  assert(entries.list().empty());

  // Configured cascade applies to the single-argument overload.
  const auto other = seed_transaction(store, period);
  assert(entries.validate_and_persist({.transaction = other, .account = cash, .debit = {}, .credit = money("5")}).ok());
  ledger::TransactionService cascading{store, {.default_currency = "USD", .delete_policy = common::DeletionPolicy::kCascade}};
  assert(cascading.remove(other).ok());
  assert(entries.list().empty());

  // An empty transaction can always be removed.
  const auto empty = seed_transaction(store, period);
  assert(transactions.remove(empty).ok());
  assert(transactions.remove(empty).kind == common::ErrorKind::kNotFound);
}

void test_journal_order() {
  store::Store store;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto sales = seed_account(store, "4101", "Sales", common::AccountClass::kIncome);
  const auto late = seed_transaction(store, period, at(2026, 6, 1));
  const auto early = seed_transaction(store, period, at(2026, 1, 10));
  ledger::EntryValidator entries{store};

  assert(entries.validate_and_persist({.transaction = late, .account = cash, .debit = money("7"), .credit = {}}).ok());
  assert(entries.validate_and_persist({.transaction = early, .account = cash, .debit = money("3"), .credit = {}}).ok());
  assert(entries.validate_and_persist({.transaction = early, .account = sales, .debit = {}, .credit = money("3")}).ok());

  ledger::LedgerBook book{store};
  auto journal = book.journal();
  assert(journal.size() == 3);
  assert(journal[0].transaction == early);
  assert(journal[0].account_code == "1101");
  assert(journal[1].transaction == early);
  assert(journal[1].account_name == "Sales");
  assert(journal[0].entry < journal[1].entry);
  assert(journal[2].transaction == late);

  assert(book.journal(period).size() == 3);
  assert(book.journal(period + 1).empty());
}

void test_general_ledger() {
  store::Store store;
  const auto period = seed_period(store);
  seed_account(store, "1", "Assets");
  const auto cash = seed_account(store, "1101", "Cash");
  const auto bank = seed_account(store, "1102", "Bank");
  const auto payable = seed_account(store, "2105", "Tax payable", common::AccountClass::kLiability);
  const auto sales = seed_account(store, "41", "Sales", common::AccountClass::kIncome);
  seed_account(store, "5101", "Rent", common::AccountClass::kExpense);
  const auto march = seed_transaction(store, period, at(2026, 3, 15));
  const auto july = seed_transaction(store, period, at(2026, 7, 1));
  ledger::EntryValidator entries{store};

  assert(entries.validate_and_persist({.transaction = march, .account = cash, .debit = money("113"), .credit = {}}).ok());
  assert(entries.validate_and_persist({.transaction = march, .account = sales, .debit = {}, .credit = money("100")}).ok());
  assert(entries.validate_and_persist({.transaction = march, .account = payable, .debit = {}, .credit = money("13")}).ok());
  assert(entries.validate_and_persist({.transaction = july, .account = bank, .debit = money("50"), .credit = {}}).ok());
  assert(entries.validate_and_persist({.transaction = july, .account = cash, .debit = {}, .credit = money("50")}).ok());

  ledger::LedgerBook book{store};
  auto report = book.general_ledger({.digits = 1, .include_detail = true});
  assert(report.ok());
  const auto& majors = report.value->majors;
  assert(majors.size() == 4);
  assert(majors[0].code == "1");
  assert(majors[0].name == "Assets");
  assert(majors[0].debit == money("163"));
  assert(majors[0].credit == money("50"));
  assert(majors[0].balance == money("113"));
  assert(majors[0].detail.size() == 3);
  assert(majors[0].detail[0].code == "1");
  assert(majors[0].detail[1].code == "1101");
  assert(majors[1].code == "2");
  assert(majors[1].name == "Major account 2");
  assert(majors[1].balance == money("-13"));
  assert(majors[2].code == "4");
  // Accounts without movements still appear.
  assert(majors[3].code == "5");
  assert(majors[3].debit.is_zero());
  assert(report.value->summary.major_accounts == 4);
  assert(report.value->summary.total_debit == money("163"));
  assert(report.value->summary.total_credit == money("163"));
  assert(report.value->summary.difference.is_zero());

  auto first_half = book.general_ledger(
      {.digits = 4, .from = common::make_date(2026, 1, 1), .to = common::make_date(2026, 6, 30)});
  assert(first_half.ok());
  assert(first_half.value->majors.size() == 6);
  assert(first_half.value->majors[0].code == "1000");
  assert(first_half.value->majors[0].detail.empty());
  assert(first_half.value->summary.total_debit == money("113"));
  bool found_padded_sales = false;
  for (const auto& major : first_half.value->majors) {
    if (major.code == "4100") {
      found_padded_sales = true;
      assert(major.credit == money("100"));
    }
  }
  assert(found_padded_sales);

  assert(ledger::LedgerBook::major_code("41", 4) == "4100");
  assert(ledger::LedgerBook::major_code("410123", 2) == "41");

  auto zero_digits = book.general_ledger({.digits = 0});
  assert(zero_digits.status.kind == common::ErrorKind::kConstraintViolation);
  auto eleven_digits = book.general_ledger({.digits = 11});
  assert(eleven_digits.status.kind == common::ErrorKind::kConstraintViolation);
  auto reversed = book.general_ledger(
      {.digits = 1, .from = common::make_date(2026, 6, 1), .to = common::make_date(2026, 1, 1)});
  assert(reversed.status.kind == common::ErrorKind::kConstraintViolation);
  assert(reversed.status.reject_code == 2202);
}

}  // namespace ledgercore::tests
