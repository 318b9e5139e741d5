#include "test_store.hpp"

#include <cassert>
#include <span>
#include <stdexcept>
#include <utility>

#include "ledgercore/store/codec.hpp"
#include "ledgercore/store/store.hpp"
#include "ledgercore/store/unit_of_work.hpp"
#include "test_fixtures.hpp"

namespace ledgercore::tests {

void test_unit_of_work_isolation() {
  store::Store store;

  {
    store::UnitOfWork uow(store);
    uow.put(store::AccountRow{.id = uow.next_id<store::AccountRow>(), .code = "1", .name = "Assets"});
    // Own writes are visible inside the unit only.
    assert(uow.contains<store::AccountRow>(1));
    assert(store.read([](const store::Tables& tables) { return tables.accounts.size(); }) == 0);
    // Destroyed without commit: rolled back.
  }
  assert(store.read([](const store::Tables& tables) { return tables.accounts.size(); }) == 0);

  store::UnitOfWork uow(store);
  const auto id = uow.next_id<store::AccountRow>();
  assert(id == 2);
  uow.put(store::AccountRow{.id = id, .code = "1", .name = "Assets"});
  uow.put(store::AccountRow{.id = id + 1, .code = "2", .name = "Liabilities"});
  uow.erase<store::AccountRow>(id + 1);
  assert(uow.select<store::AccountRow>([](const store::AccountRow&) { return true; }).size() == 1);
  assert(uow.commit().ok());
  assert(uow.finished());
  assert(uow.commit().reject_code == store::codes::kUnitFinished);

  auto version = store.read([id](const store::Tables& tables) { return tables.accounts.version(id); });
  assert(version == 1);

  store::UnitOfWork rename(store);
  auto row = rename.get<store::AccountRow>(id);
  row->name = "Total assets";
  rename.put(*row);
  rename.rollback();
  assert(store.read([id](const store::Tables& tables) { return tables.accounts.find(id)->name; }) == "Assets");
}

void test_commit_integrity() {
  store::Store store;
  const auto period = seed_period(store);
  const auto cash = seed_account(store, "1101", "Cash");
  const auto transaction = seed_transaction(store, period);

  {
    store::UnitOfWork uow(store);
    uow.put(store::EntryRow{.id = uow.next_id<store::EntryRow>(), .transaction = transaction + 9, .account = cash,
                            .debit = money("1"), .credit = {}});
    auto status = uow.commit();
    assert(status.kind == common::ErrorKind::kNotFound);
    assert(status.reject_code == store::codes::kMissingTransaction);
  }

  {
    store::UnitOfWork uow(store);
    uow.put(store::AccountRow{.id = uow.next_id<store::AccountRow>(), .code = "1101", .name = "Duplicate"});
    auto status = uow.commit();
    assert(status.kind == common::ErrorKind::kConstraintViolation);
    assert(status.reject_code == store::codes::kDuplicateAccountCode);
  }

  {
    store::UnitOfWork uow(store);
    uow.put(store::EntryRow{.id = uow.next_id<store::EntryRow>(), .transaction = transaction, .account = cash,
                            .debit = money("1"), .credit = {}});
    assert(uow.commit().ok());
  }

  {
    store::UnitOfWork uow(store);
    uow.erase<store::AccountRow>(cash);
    auto status = uow.commit();
    assert(status.kind == common::ErrorKind::kReferentialIntegrity);
    assert(status.reject_code == store::codes::kAccountReferenced);
  }

  {
    store::UnitOfWork uow(store);
    uow.erase<store::TransactionRow>(transaction);
    auto status = uow.commit();
    assert(status.reject_code == store::codes::kTransactionHasEntries);
  }

  // Nothing of the rejected units reached the tables.
  auto sizes = store.read([](const store::Tables& tables) {
    return std::make_pair(tables.accounts.size(), tables.entries.size());
  });
  assert(sizes.first == 1);
  assert(sizes.second == 1);
}

void test_commit_guards() {
  store::Store store;
  const auto cash = seed_account(store, "1101", "Cash");

  store::UnitOfWork first(store);
  first.expect_version<store::AccountRow>(cash);
  auto row = first.get<store::AccountRow>(cash);
  row->name = "First";
  first.put(*row);

  store::UnitOfWork second(store);
  auto other = second.get<store::AccountRow>(cash);
  other->name = "Second";
  second.put(*other);
  assert(second.commit().ok());

  auto status = first.commit();
  assert(status.kind == common::ErrorKind::kConcurrencyConflict);
  assert(status.reject_code == store::codes::kVersionConflict);

  store::UnitOfWork guarded(store);
  guarded.put(store::AccountRow{.id = guarded.next_id<store::AccountRow>(), .code = "9", .name = "Blocked"});
  guarded.add_guard([](const store::CommitView& view) {
    if (view.any<store::AccountRow>([](const store::AccountRow& account) { return account.code == "9"; })) {
      return common::reject(common::ErrorKind::kConstraintViolation, 9999, "blocked by guard");
    }
    return common::ok_status();
  });
  assert(guarded.commit().reject_code == 9999);
  assert(store.read([](const store::Tables& tables) { return tables.accounts.size(); }) == 1);
}

void test_change_set_codec() {
  store::ChangeSet changes;
  changes.of<store::AccountRow>().emplace(
      7, store::AccountRow{.id = 7, .code = "1101", .name = "Caja", .classification = common::AccountClass::kAsset});
  changes.of<store::TransactionRow>().emplace(
      3, store::TransactionRow{.id = 3,
                               .occurred_at = at(2026, 3, 15, 14),
                               .description = "Venta",
                               .kind = common::TransactionKind::kIncome,
                               .currency = "CRC",
                               .created_at = at(2026, 3, 15, 15),
                               .created_by = "ana",
                               .period = 1});
  changes.of<store::EntryRow>().emplace(11, std::nullopt);
  changes.of<store::ProductRow>().emplace(
      2, store::ProductRow{.id = 2, .code = "P-2", .name = "Widget", .unit_price = money("25.00"), .taxable = false});
  changes.of<store::ClientRow>().emplace(5, store::ClientRow{.id = 5, .name = "Acme", .tax_id = std::nullopt});

  store::InvoiceRow invoice{.id = "5f1c0b7e-3a6d-4c1e-9b7a-2d4e6f8a0c12",
                            .number = "FACT-2026-0001",
                            .client = 5,
                            .issue_date = common::make_date(2026, 3, 15),
                            .due_date = common::make_date(2026, 4, 14),
                            .payment_terms = "Credito",
                            .discount = money("1.50")};
  changes.of<store::InvoiceRow>().emplace(invoice.id, invoice);
  changes.of<store::InvoiceLineRow>().emplace(
      9, store::InvoiceLineRow{.id = 9, .invoice = invoice.id, .product = 2, .quantity = money("2"),
                               .unit_price = money("25.00"), .subtotal = money("50.00"), .total = money("50.00")});

  const auto encoded = store::ChangeSetCodec::encode(changes);
  const auto decoded = store::ChangeSetCodec::decode(encoded);
  assert(decoded.accounts == changes.accounts);
  assert(decoded.transactions == changes.transactions);
  assert(decoded.entries == changes.entries);
  assert(decoded.products == changes.products);
  assert(decoded.clients == changes.clients);
  assert(decoded.invoices == changes.invoices);
  assert(decoded.invoice_lines == changes.invoice_lines);
  assert(decoded.periods.empty());

  bool threw = false;
  try {
    auto truncated = std::span<const std::byte>(encoded.data(), encoded.size() / 2);
    (void)store::ChangeSetCodec::decode(truncated);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto bad_version = encoded;
  bad_version[0] = std::byte{0x7f};
  threw = false;
  try {
    (void)store::ChangeSetCodec::decode(bad_version);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace ledgercore::tests
