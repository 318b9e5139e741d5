#include "ledgercore/store/store.hpp"

#include <algorithm>

#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"

namespace ledgercore {
namespace store {

namespace {

using common::ErrorKind;
using common::Status;

Status missing(std::uint16_t code, std::string message) {
  return common::reject(ErrorKind::kNotFound, code, std::move(message));
}

Status duplicate(std::uint16_t code, std::string message) {
  return common::reject(ErrorKind::kConstraintViolation, code, std::move(message));
}

Status referenced(std::uint16_t code, std::string message) {
  return common::reject(ErrorKind::kReferentialIntegrity, code, std::move(message));
}

// Foreign keys of every row being written must resolve in the combined state.
Status check_references(const CommitView& view) {
  const auto& staged = view.staged();

  for (const auto& [id, row] : staged.transactions) {
    if (row && !view.find<PeriodRow>(row->period)) {
      return missing(codes::kMissingPeriod, "period " + std::to_string(row->period) + " does not exist");
    }
  }
  for (const auto& [id, row] : staged.entries) {
    if (!row) {
      continue;
    }
    if (!view.find<TransactionRow>(row->transaction)) {
      return missing(codes::kMissingTransaction,
                     "transaction " + std::to_string(row->transaction) + " does not exist");
    }
    if (!view.find<AccountRow>(row->account)) {
      return missing(codes::kMissingAccount, "account " + std::to_string(row->account) + " does not exist");
    }
  }
  for (const auto& [id, row] : staged.invoices) {
    if (!row) {
      continue;
    }
    if (row->client && !view.find<ClientRow>(*row->client)) {
      return missing(codes::kMissingClient, "client " + std::to_string(*row->client) + " does not exist");
    }
    if (row->transaction && !view.find<TransactionRow>(*row->transaction)) {
      return missing(codes::kMissingTransaction,
                     "transaction " + std::to_string(*row->transaction) + " does not exist");
    }
  }
  for (const auto& [id, row] : staged.invoice_lines) {
    if (!row) {
      continue;
    }
    if (!view.find<InvoiceRow>(row->invoice)) {
      return missing(codes::kMissingInvoice, "invoice " + row->invoice + " does not exist");
    }
    if (!view.find<ProductRow>(row->product)) {
      return missing(codes::kMissingProduct, "product " + std::to_string(row->product) + " does not exist");
    }
  }
  return common::ok_status();
}

Status check_unique_keys(const CommitView& view) {
  const auto& staged = view.staged();

  for (const auto& [id, row] : staged.accounts) {
    if (row && view.any<AccountRow>([&](const AccountRow& other) {
          return other.id != row->id && other.code == row->code;
        })) {
      return duplicate(codes::kDuplicateAccountCode, "account code " + row->code + " already exists");
    }
  }
  for (const auto& [id, row] : staged.products) {
    if (row && row->code && view.any<ProductRow>([&](const ProductRow& other) {
          return other.id != row->id && other.code == row->code;
        })) {
      return duplicate(codes::kDuplicateProductCode, "product code " + *row->code + " already exists");
    }
  }
  for (const auto& [id, row] : staged.clients) {
    if (row && row->tax_id && view.any<ClientRow>([&](const ClientRow& other) {
          return other.id != row->id && other.tax_id == row->tax_id;
        })) {
      return duplicate(codes::kDuplicateClientTaxId, "client tax id " + *row->tax_id + " already exists");
    }
  }
  for (const auto& [id, row] : staged.invoices) {
    if (row && view.any<InvoiceRow>([&](const InvoiceRow& other) {
          return other.id != row->id && other.number == row->number;
        })) {
      return duplicate(codes::kDuplicateInvoiceNumber, "invoice number " + row->number + " already exists");
    }
  }
  return common::ok_status();
}

// Rows being deleted must not be referenced by anything left behind.
Status check_restricted_deletes(const CommitView& view) {
  const auto& staged = view.staged();

  for (const auto& [id, row] : staged.periods) {
    if (!row && view.any<TransactionRow>([&](const TransactionRow& t) { return t.period == id; })) {
      return referenced(codes::kPeriodReferenced, "period " + std::to_string(id) + " is referenced by transactions");
    }
  }
  for (const auto& [id, row] : staged.accounts) {
    if (!row && view.any<EntryRow>([&](const EntryRow& e) { return e.account == id; })) {
      return referenced(codes::kAccountReferenced,
                        "account " + std::to_string(id) + " is referenced by ledger entries");
    }
  }
  for (const auto& [id, row] : staged.transactions) {
    if (row) {
      continue;
    }
    if (view.any<EntryRow>([&](const EntryRow& e) { return e.transaction == id; })) {
      return referenced(codes::kTransactionHasEntries, "transaction " + std::to_string(id) + " still has entries");
    }
    if (view.any<InvoiceRow>([&](const InvoiceRow& i) { return i.transaction == id; })) {
      return referenced(codes::kTransactionInvoiced,
                        "transaction " + std::to_string(id) + " is referenced by invoices");
    }
  }
  for (const auto& [id, row] : staged.products) {
    if (!row && view.any<InvoiceLineRow>([&](const InvoiceLineRow& l) { return l.product == id; })) {
      return referenced(codes::kProductReferenced,
                        "product " + std::to_string(id) + " is referenced by invoice lines");
    }
  }
  for (const auto& [id, row] : staged.clients) {
    if (!row && view.any<InvoiceRow>([&](const InvoiceRow& i) { return i.client == id; })) {
      return referenced(codes::kClientReferenced, "client " + std::to_string(id) + " is referenced by invoices");
    }
  }
  for (const auto& [id, row] : staged.invoices) {
    if (!row && view.any<InvoiceLineRow>([&](const InvoiceLineRow& l) { return l.invoice == id; })) {
      return referenced(codes::kInvoiceHasLines, "invoice " + id + " still has lines");
    }
  }
  return common::ok_status();
}

Status check_integrity(const CommitView& view) {
  if (auto status = check_references(view); !status.ok()) {
    return status;
  }
  if (auto status = check_unique_keys(view); !status.ok()) {
    return status;
  }
  return check_restricted_deletes(view);
}

template <typename Row>
std::uint64_t highest_key(const Changes<Row>& changes) {
  return changes.empty() ? 0 : static_cast<std::uint64_t>(changes.rbegin()->first);
}

}  // namespace

RowLock LockTable::acquire(LockScope scope, const std::string& key) {
  std::shared_ptr<std::mutex> row_mutex;
  {
    std::scoped_lock lock(mutex_);
    if (rows_.size() >= kSweepThreshold) {
      std::erase_if(rows_, [](const auto& item) { return item.second.expired(); });
    }
    auto& slot = rows_[{scope, key}];
    row_mutex = slot.lock();
    if (!row_mutex) {
      row_mutex = std::make_shared<std::mutex>();
      slot = row_mutex;
    }
  }
  // Block outside the table mutex so unrelated rows are not serialized.
  return RowLock{std::move(row_mutex)};
}

Store::Store(common::ConcurrencyMode mode) : mode_(mode) {}

void Store::set_journal_listener(JournalListener listener) {
  std::unique_lock lock(mutex_);
  journal_ = std::move(listener);
}

Status Store::commit(const ChangeSet& changes, const std::vector<Guard>& guards) {
  std::unique_lock lock(mutex_);
  const CommitView view(tables_, changes);

  // Guards first: a unit that read stale rows reports a conflict, not the
  // integrity failure its stale reads lead to.
  auto status = common::ok_status();
  for (auto it = guards.begin(); status.ok() && it != guards.end(); ++it) {
    status = (*it)(view);
  }
  if (status.ok()) {
    status = check_integrity(view);
  }

  if (!status.ok()) {
    if (telemetry_) {
      telemetry_->increment(status.kind == ErrorKind::kConcurrencyConflict ? telemetry::metrics::kCommitConflicts
                                                                            : telemetry::metrics::kCommitsRejected);
    }
    return status;
  }

  if (changes.empty()) {
    return status;
  }

  if (journal_) {
    journal_(changes);
  }
  tables_.apply(changes);

  if (telemetry_) {
    telemetry_->increment(telemetry::metrics::kCommitsApplied);
  }
  return status;
}

void Store::replay(const ChangeSet& changes) {
  std::unique_lock lock(mutex_);
  tables_.apply(changes);

  advance_sequence(sequence_index<AccountRow>(), highest_key(changes.accounts));
  advance_sequence(sequence_index<PeriodRow>(), highest_key(changes.periods));
  advance_sequence(sequence_index<TransactionRow>(), highest_key(changes.transactions));
  advance_sequence(sequence_index<EntryRow>(), highest_key(changes.entries));
  advance_sequence(sequence_index<ProductRow>(), highest_key(changes.products));
  advance_sequence(sequence_index<ClientRow>(), highest_key(changes.clients));
  advance_sequence(sequence_index<InvoiceLineRow>(), highest_key(changes.invoice_lines));
}

void Store::advance_sequence(std::size_t index, std::uint64_t seen) noexcept {
  auto& sequence = sequences_[index];
  auto current = sequence.load(std::memory_order_relaxed);
  while (current < seen && !sequence.compare_exchange_weak(current, seen, std::memory_order_relaxed)) {
  }
}

}  // namespace store
}  // namespace ledgercore
