#include "test_persistence.hpp"

#include <array>
#include <cassert>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <span>
#include <stdexcept>

#include "ledgercore/identity/token_generator.hpp"
#include "ledgercore/invoice/invoice_service.hpp"
#include "ledgercore/ledger/balance_query.hpp"
#include "ledgercore/ledger/entry_validator.hpp"
#include "ledgercore/replay/replay_driver.hpp"
#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"
#include "ledgercore/wal/wal_writer.hpp"
#include "test_fixtures.hpp"

namespace ledgercore::tests {

namespace {

std::filesystem::path fresh_dir(const char* name) {
  const auto dir = std::filesystem::temp_directory_path() / "ledgercore_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void append_int(wal::Writer& writer, std::int32_t value) {
  std::array<std::byte, sizeof(value)> payload{};
  std::memcpy(payload.data(), &value, sizeof(value));
  writer.append(std::span<const std::byte>(payload.data(), payload.size()));
}

}  // namespace

void test_journal_records() {
  const auto dir = fresh_dir("records");
  const auto path = dir / "commits.journal";

  {
    wal::Writer writer(path, 16);
    append_int(writer, 10);
    append_int(writer, -5);
    append_int(writer, 2);
    writer.sync();
    assert(writer.next_sequence() == 4);
  }
  {
    // Reopening continues the sequence.
    wal::Writer writer(path, 16);
    assert(writer.next_sequence() == 4);
    append_int(writer, 40);
    writer.sync();
  }

  replay::Driver driver;
  driver.configure(path);
  std::int64_t sum = 0;
  std::uint64_t last_sequence = 0;
  driver.set_event_handler([&](const wal::Record& record) {
    std::int32_t value = 0;
    std::memcpy(&value, record.payload.data(), sizeof(value));
    sum += value;
    assert(record.header.sequence == last_sequence + 1 || last_sequence == 0);
    last_sequence = record.header.sequence;
  });
  assert(driver.execute() == 4);
  assert(sum == 47);
  assert(last_sequence == 4);

  sum = 0;
  last_sequence = 0;
  assert(driver.execute(3) == 2);
  assert(sum == 42);

  replay::Driver missing;
  missing.configure(dir / "absent.journal");
  missing.set_event_handler([](const wal::Record&) { assert(false); });
  assert(missing.execute() == 0);

  std::filesystem::remove_all(dir);
}

void test_journal_corruption() {
  const auto dir = fresh_dir("corruption");
  const auto path = dir / "commits.journal";
  {
    wal::Writer writer(path, 1);
    append_int(writer, 1234);
    writer.sync();
  }

  // Flip the last payload byte.
  const auto size = std::filesystem::file_size(path);
  std::FILE* file = std::fopen(path.c_str(), "r+b");
  assert(file != nullptr);
  std::fseek(file, static_cast<long>(size - 1), SEEK_SET);
  const int original = std::fgetc(file);
  std::fseek(file, static_cast<long>(size - 1), SEEK_SET);
  std::fputc(original ^ 0xff, file);
  std::fclose(file);

  wal::Reader reader(path);
  wal::Record record;
  bool threw = false;
  try {
    reader.next(record);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // A torn tail is reported the same way.
  std::filesystem::resize_file(path, size - 2);
  wal::Reader torn(path);
  threw = false;
  try {
    torn.next(record);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
}

void test_persistence_replay() {
  const auto dir = fresh_dir("replay");
  const auto path = dir / "commits.journal";
  identity::TokenGenerator tokens;

  common::InvoiceId invoice_id;
  common::TransactionId transaction{0};
  {
    store::Store store;
    telemetry::TelemetrySink sink;
    wal::Writer writer(path, 256);
    replay::attach_writer(store, writer, &sink);

    const auto period = seed_period(store);
    const auto cash = seed_account(store, "1101", "Cash");
    const auto sales = seed_account(store, "4101", "Sales", common::AccountClass::kIncome);
    transaction = seed_transaction(store, period);
    ledger::EntryValidator entries{store};
    assert(entries.validate_and_persist({.transaction = transaction, .account = cash, .debit = money("56.50"), .credit = {}})
               .ok());
    assert(entries.validate_and_persist({.transaction = transaction, .account = sales, .debit = {}, .credit = money("56.50")})
               .ok());

    const auto widget = seed_product(store, "Widget", money("25.00"));
    invoice::InvoiceService invoices{store, tokens};
    auto invoice = invoices.create({.transaction = transaction, .issue_date = common::make_date(2026, 3, 15)});
    invoice_id = invoice.value->id;
    auto line = invoices.add_line(invoice_id, {.product = widget, .quantity = money("2"), .discount_percentage = money("10")});
    assert(line.ok());
    assert(invoices.add_line(invoice_id, {.product = widget, .quantity = money("1")}).ok());
    assert(invoices.remove_line(line.value->id).ok());

    // Rejected commits never reach the journal.
    assert(!entries.validate_and_persist({.transaction = transaction, .account = cash, .debit = {}, .credit = {}}).ok());

    writer.sync();
    auto counters = sink.drain_counters();
    assert(counters[telemetry::metrics::kJournalRecordsWritten] == 11);
  }

  store::Store rebuilt;
  telemetry::TelemetrySink sink;
  replay::Driver driver;
  driver.configure(path);
  assert(driver.rebuild(rebuilt, &sink) == 11);
  assert(sink.drain_counters()[telemetry::metrics::kJournalRecordsReplayed] == 11);

  invoice::InvoiceService invoices{rebuilt, tokens};
  auto invoice = invoices.get(invoice_id);
  assert(invoice.ok());
  assert(invoice.value->transaction == transaction);
  assert(invoice.value->totals.subtotal() == money("25.00"));
  assert(invoice.value->totals.grand_total() == money("28.25"));
  assert(invoices.lines(invoice_id).size() == 1);

  ledger::BalanceQuery balances{rebuilt};
  auto balance = balances.compute_balance(transaction);
  assert(balance.ok());
  assert(balance.value->is_balanced);
  assert(balance.value->total_debit == money("56.50"));

  // Sequences resume past the replayed keys.
  const auto next_account = seed_account(rebuilt, "5101", "Rent", common::AccountClass::kExpense);
  assert(next_account == 3);
  const auto widget_again = seed_product(rebuilt, "Gadget", money("1.00"));
  assert(widget_again == 2);

  std::filesystem::remove_all(dir);
}

}  // namespace ledgercore::tests
