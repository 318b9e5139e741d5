#include "test_concurrency.hpp"

#include <atomic>
#include <cassert>
#include <thread>
#include <vector>

#include "ledgercore/identity/token_generator.hpp"
#include "ledgercore/invoice/invoice_service.hpp"
#include "ledgercore/ledger/balance_query.hpp"
#include "ledgercore/ledger/entry_validator.hpp"
#include "ledgercore/ledger/transaction_service.hpp"
#include "ledgercore/store/unit_of_work.hpp"
#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"
#include "test_fixtures.hpp"

namespace ledgercore::tests {

namespace {

constexpr int kRounds = 50;

// Retries on ConcurrencyConflict, the way a caller of the optimistic mode must.
common::Result<store::InvoiceLineRow> add_line_with_retry(invoice::InvoiceService& invoices,
                                                          const common::InvoiceId& id,
                                                          const invoice::LineDraft& draft) {
  for (;;) {
    auto result = invoices.add_line(id, draft);
    if (result.status.kind != common::ErrorKind::kConcurrencyConflict) {
      return result;
    }
  }
}

// Two writers add lines of 10.00 and 20.00 to the same invoice at the same
// time, many times over; no addition may be lost from the grand total.
void run_two_writers(common::ConcurrencyMode mode) {
  store::Store store{mode};
  identity::TokenGenerator tokens;
  invoice::InvoiceService invoices{store, tokens};
  const auto ten = seed_product(store, "Ten", money("10.00"));
  const auto twenty = seed_product(store, "Twenty", money("20.00"));

  for (int round = 0; round < kRounds; ++round) {
    auto created = invoices.create({.issue_date = common::make_date(2026, 4, 1)});
    assert(created.ok());
    const auto id = created.value->id;

    std::atomic<bool> go{false};
    auto writer = [&](common::ProductId product) {
      while (!go.load(std::memory_order_acquire)) {
        std::this_thread::yield();
      }
      auto line = add_line_with_retry(invoices, id, {.product = product, .quantity = money("1")});
      assert(line.ok());
    };
    std::thread first(writer, ten);
    std::thread second(writer, twenty);
    go.store(true, std::memory_order_release);
    first.join();
    second.join();

    auto header = invoices.get(id);
    assert(header.ok());
    assert(invoices.lines(id).size() == 2);
    assert(header.value->totals.subtotal() == money("30.00"));
    assert(header.value->totals.tax() == money("3.90"));
    assert(header.value->totals.grand_total() == money("33.90"));
  }
}

}  // namespace

void test_concurrent_lines_locking() {
  run_two_writers(common::ConcurrencyMode::kLocking);
}

void test_concurrent_lines_optimistic() {
  run_two_writers(common::ConcurrencyMode::kOptimistic);
}

void test_optimistic_conflict_reported() {
  store::Store store{common::ConcurrencyMode::kOptimistic};
  telemetry::TelemetrySink sink;
  store.set_telemetry(&sink);
  identity::TokenGenerator tokens;
  invoice::InvoiceService invoices{store, tokens};
  const auto widget = seed_product(store, "Widget", money("10.00"));
  auto created = invoices.create({.issue_date = common::make_date(2026, 4, 1)});
  const auto id = created.value->id;

  // A unit that read the invoice before another writer committed must not
  // overwrite the newer totals.
  store::UnitOfWork stale(store);
  stale.serialize_on<store::InvoiceRow>(id);
  auto header = stale.get<store::InvoiceRow>(id);
  assert(header.has_value());
  header->notes = "stale edit";
  stale.put(*header);

  assert(invoices.add_line(id, {.product = widget, .quantity = money("1")}).ok());

  auto status = stale.commit();
  assert(status.kind == common::ErrorKind::kConcurrencyConflict);
  auto current = invoices.get(id);
  assert(current.value->notes.empty());
  assert(current.value->totals.grand_total() == money("11.30"));

  auto counters = sink.drain_counters();
  assert(counters[telemetry::metrics::kCommitConflicts] == 1);
}

void test_optimistic_entry_conflict() {
  store::Store store{common::ConcurrencyMode::kOptimistic};
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto sales = seed_account(store, "4101", "Sales", common::AccountClass::kIncome);
  const auto transaction = seed_transaction(store, period);
  ledger::EntryValidator entries{store};
  ledger::TransactionService transactions{store};
  auto first = entries.validate_and_persist(
      {.transaction = transaction, .account = cash, .debit = money("10.00"), .credit = {}});
  assert(first.ok());

  // A cascade delete that collected the entries before another entry landed
  // must be told to retry, not that the transaction still has entries.
  store::UnitOfWork stale(store);
  stale.serialize_on<store::TransactionRow>(transaction);
  const auto seen = stale.select<store::EntryRow>(
      [transaction](const store::EntryRow& row) { return row.transaction == transaction; });
  assert(seen.size() == 1);
  for (const auto& entry : seen) {
    stale.erase<store::EntryRow>(entry.id);
  }
  stale.erase<store::TransactionRow>(transaction);

  assert(entries
             .validate_and_persist({.transaction = transaction, .account = sales, .debit = {}, .credit = money("10.00")})
             .ok());

  auto status = stale.commit();
  assert(status.kind == common::ErrorKind::kConcurrencyConflict);
  assert(transactions.get(transaction).ok());
  assert(entries.list({.transaction = transaction}).size() == 2);

  // Updating and removing an entry advance the parent the same way.
  store::UnitOfWork before_update(store);
  before_update.serialize_on<store::TransactionRow>(transaction);
  assert(entries.update(first.value->id, {.transaction = transaction, .account = cash, .debit = money("12.00"), .credit = {}})
             .ok());
  assert(before_update.commit().kind == common::ErrorKind::kConcurrencyConflict);

  store::UnitOfWork before_remove(store);
  before_remove.serialize_on<store::TransactionRow>(transaction);
  assert(entries.remove(first.value->id).ok());
  assert(before_remove.commit().kind == common::ErrorKind::kConcurrencyConflict);

  // The retry sees every entry and succeeds.
  assert(transactions.remove(transaction, common::DeletionPolicy::kCascade).ok());
  assert(!transactions.get(transaction).ok());
  assert(entries.list({.transaction = transaction}).empty());
}

void test_concurrent_entries() {
  store::Store store;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto sales = seed_account(store, "4101", "Sales", common::AccountClass::kIncome);
  const auto transaction = seed_transaction(store, period);
  ledger::EntryValidator entries{store};

  constexpr int kPerThread = 100;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const bool debit = (t % 2) == 0;
        auto entry = entries.validate_and_persist({.transaction = transaction,
                                                   .account = debit ? cash : sales,
                                                   .debit = debit ? money("1.00") : money("0"),
                                                   .credit = debit ? money("0") : money("1.00")});
        assert(entry.ok());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  ledger::BalanceQuery balances{store};
  auto balance = balances.compute_balance(transaction);
  assert(balance.ok());
  assert(balance.value->total_debit == money("200.00"));
  assert(balance.value->total_credit == money("200.00"));
  assert(balance.value->is_balanced);
}

}  // namespace ledgercore::tests
