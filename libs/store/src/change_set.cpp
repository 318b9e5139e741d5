#include "ledgercore/store/change_set.hpp"

namespace ledgercore {
namespace store {

namespace {

template <typename Row>
void apply_changes(Table<Row>& table, const Changes<Row>& changes) {
  for (const auto& [key, row] : changes) {
    if (row) {
      table.put(*row);
    } else {
      table.erase(key);
    }
  }
}

}  // namespace

void ChangeSet::clear() noexcept {
  accounts.clear();
  periods.clear();
  transactions.clear();
  entries.clear();
  products.clear();
  clients.clear();
  invoices.clear();
  invoice_lines.clear();
}

void Tables::apply(const ChangeSet& changes) {
  apply_changes(accounts, changes.accounts);
  apply_changes(periods, changes.periods);
  apply_changes(transactions, changes.transactions);
  apply_changes(entries, changes.entries);
  apply_changes(products, changes.products);
  apply_changes(clients, changes.clients);
  apply_changes(invoices, changes.invoices);
  apply_changes(invoice_lines, changes.invoice_lines);
}

}  // namespace store
}  // namespace ledgercore
