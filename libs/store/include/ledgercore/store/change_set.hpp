#pragma once

#include <map>
#include <optional>
#include <type_traits>

#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/table.hpp"

namespace ledgercore {
namespace store {

// Staged writes for one table: a value is an upsert, nullopt is a delete.
template <typename Row>
using Changes = std::map<KeyOf<Row>, std::optional<Row>>;

namespace detail {
template <typename T, typename... Ts>
inline constexpr bool kOneOf = (std::is_same_v<T, Ts> || ...);

template <typename Row>
inline constexpr bool kStoredRow = kOneOf<Row, AccountRow, PeriodRow, TransactionRow, EntryRow,
                                          ProductRow, ClientRow, InvoiceRow, InvoiceLineRow>;
}  // namespace detail

// Everything one unit of work wants to write, grouped per table.
struct ChangeSet {
  Changes<AccountRow> accounts{};
  Changes<PeriodRow> periods{};
  Changes<TransactionRow> transactions{};
  Changes<EntryRow> entries{};
  Changes<ProductRow> products{};
  Changes<ClientRow> clients{};
  Changes<InvoiceRow> invoices{};
  Changes<InvoiceLineRow> invoice_lines{};

  template <typename Row>
  Changes<Row>& of() {
    static_assert(detail::kStoredRow<Row>);
    if constexpr (std::is_same_v<Row, AccountRow>) {
      return accounts;
    } else if constexpr (std::is_same_v<Row, PeriodRow>) {
      return periods;
    } else if constexpr (std::is_same_v<Row, TransactionRow>) {
      return transactions;
    } else if constexpr (std::is_same_v<Row, EntryRow>) {
      return entries;
    } else if constexpr (std::is_same_v<Row, ProductRow>) {
      return products;
    } else if constexpr (std::is_same_v<Row, ClientRow>) {
      return clients;
    } else if constexpr (std::is_same_v<Row, InvoiceRow>) {
      return invoices;
    } else {
      return invoice_lines;
    }
  }

  template <typename Row>
  const Changes<Row>& of() const {
    return const_cast<ChangeSet*>(this)->of<Row>();
  }

  [[nodiscard]] bool empty() const noexcept {
    return accounts.empty() && periods.empty() && transactions.empty() && entries.empty() &&
           products.empty() && clients.empty() && invoices.empty() && invoice_lines.empty();
  }

  void clear() noexcept;
};

struct Tables {
  Table<AccountRow> accounts{};
  Table<PeriodRow> periods{};
  Table<TransactionRow> transactions{};
  Table<EntryRow> entries{};
  Table<ProductRow> products{};
  Table<ClientRow> clients{};
  Table<InvoiceRow> invoices{};
  Table<InvoiceLineRow> invoice_lines{};

  template <typename Row>
  Table<Row>& of() {
    static_assert(detail::kStoredRow<Row>);
    if constexpr (std::is_same_v<Row, AccountRow>) {
      return accounts;
    } else if constexpr (std::is_same_v<Row, PeriodRow>) {
      return periods;
    } else if constexpr (std::is_same_v<Row, TransactionRow>) {
      return transactions;
    } else if constexpr (std::is_same_v<Row, EntryRow>) {
      return entries;
    } else if constexpr (std::is_same_v<Row, ProductRow>) {
      return products;
    } else if constexpr (std::is_same_v<Row, ClientRow>) {
      return clients;
    } else if constexpr (std::is_same_v<Row, InvoiceRow>) {
      return invoices;
    } else {
      return invoice_lines;
    }
  }

  template <typename Row>
  const Table<Row>& of() const {
    return const_cast<Tables*>(this)->of<Row>();
  }

  void apply(const ChangeSet& changes);
};

// Committed tables with a change set laid over them: the state that would
// exist if the change set were applied. Commit guards evaluate against this.
class CommitView {
 public:
  CommitView(const Tables& committed, const ChangeSet& staged) noexcept
      : committed_(committed), staged_(staged) {}

  template <typename Row>
  [[nodiscard]] const Row* find(const KeyOf<Row>& key) const {
    const auto& changes = staged_.of<Row>();
    if (auto it = changes.find(key); it != changes.end()) {
      return it->second ? &*it->second : nullptr;
    }
    return committed_.of<Row>().find(key);
  }

  template <typename Row, typename Pred>
  [[nodiscard]] bool any(Pred&& pred) const {
    const auto& changes = staged_.of<Row>();
    for (const auto& [key, row] : changes) {
      if (row && pred(*row)) {
        return true;
      }
    }
    bool found = false;
    committed_.of<Row>().for_each([&](const Row& row) {
      if (!found && !changes.contains(row.id) && pred(row)) {
        found = true;
      }
    });
    return found;
  }

  [[nodiscard]] const Tables& committed() const noexcept { return committed_; }
  [[nodiscard]] const ChangeSet& staged() const noexcept { return staged_; }

 private:
  const Tables& committed_;
  const ChangeSet& staged_;
};

}  // namespace store
}  // namespace ledgercore
