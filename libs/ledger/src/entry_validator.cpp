#include "ledgercore/ledger/entry_validator.hpp"

#include <algorithm>
#include <utility>

#include "ledgercore/store/unit_of_work.hpp"
#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"

namespace ledgercore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeBothZero = 2101;
constexpr std::uint16_t kRejectCodeBothPositive = 2102;
constexpr std::uint16_t kRejectCodeNegativeAmount = 2103;
constexpr std::uint16_t kRejectCodeUnknownTransaction = 2104;
constexpr std::uint16_t kRejectCodeUnknownAccount = 2105;
constexpr std::uint16_t kRejectCodeUnknownEntry = 2106;

using EntryResult = common::Result<store::EntryRow>;

common::Status unknown_entry(common::EntryId id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownEntry,
                        "ledger entry " + std::to_string(id) + " does not exist");
}

common::Status check_references(const store::UnitOfWork& uow, const EntryDraft& draft) {
  if (!uow.contains<store::TransactionRow>(draft.transaction)) {
    return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownTransaction,
                          "transaction " + std::to_string(draft.transaction) + " does not exist");
  }
  if (!uow.contains<store::AccountRow>(draft.account)) {
    return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownAccount,
                          "account " + std::to_string(draft.account) + " does not exist");
  }
  return common::ok_status();
}

// In optimistic mode the parent transaction's version is the serialization
// point, so every entry write rewrites the parent row to advance it.
void touch_transaction(store::UnitOfWork& uow, common::TransactionId id) {
  if (uow.mode() != common::ConcurrencyMode::kOptimistic) {
    return;
  }
  if (auto parent = uow.get<store::TransactionRow>(id)) {
    uow.put(std::move(*parent));
  }
}

}  // namespace

common::Status check_entry_amounts(common::Amount debit, common::Amount credit) {
  if (debit.is_negative() || credit.is_negative()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeNegativeAmount,
                          "debit and credit must not be negative");
  }
  if (debit.is_zero() && credit.is_zero()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeBothZero,
                          "an entry needs either a debit or a credit amount");
  }
  if (debit.is_positive() && credit.is_positive()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeBothPositive,
                          "an entry cannot carry both a debit and a credit amount");
  }
  return common::ok_status();
}

template <typename T>
common::Result<T> EntryValidator::count(common::Result<T> result) const {
  if (telemetry_) {
    telemetry_->increment(result.ok() ? telemetry::metrics::kEntriesAccepted : telemetry::metrics::kEntriesRejected);
  }
  return result;
}

EntryResult EntryValidator::validate_and_persist(const EntryDraft& draft) {
  if (auto status = check_entry_amounts(draft.debit, draft.credit); !status.ok()) {
    return count(EntryResult::failure(std::move(status)));
  }

  store::UnitOfWork uow(store_);
  uow.serialize_on<store::TransactionRow>(draft.transaction);
  if (auto status = check_references(uow, draft); !status.ok()) {
    return count(EntryResult::failure(std::move(status)));
  }

  store::EntryRow row{
      .id = uow.next_id<store::EntryRow>(),
      .transaction = draft.transaction,
      .account = draft.account,
      .debit = draft.debit,
      .credit = draft.credit,
  };
  uow.put(row);
  touch_transaction(uow, draft.transaction);
  if (auto status = uow.commit(); !status.ok()) {
    return count(EntryResult::failure(std::move(status)));
  }
  return count(EntryResult::success(std::move(row)));
}

EntryResult EntryValidator::update(common::EntryId id, const EntryDraft& draft) {
  if (auto status = check_entry_amounts(draft.debit, draft.credit); !status.ok()) {
    return count(EntryResult::failure(std::move(status)));
  }

  store::UnitOfWork uow(store_);
  auto current = uow.get<store::EntryRow>(id);
  if (!current) {
    return count(EntryResult::failure(unknown_entry(id)));
  }

  // Moving an entry touches two transactions; take them in id order.
  const auto first = std::min(current->transaction, draft.transaction);
  const auto second = std::max(current->transaction, draft.transaction);
  uow.serialize_on<store::TransactionRow>(first);
  uow.serialize_on<store::TransactionRow>(second);

  current = uow.get<store::EntryRow>(id);
  if (!current) {
    return count(EntryResult::failure(unknown_entry(id)));
  }
  if (auto status = check_references(uow, draft); !status.ok()) {
    return count(EntryResult::failure(std::move(status)));
  }

  const auto previous = current->transaction;
  current->transaction = draft.transaction;
  current->account = draft.account;
  current->debit = draft.debit;
  current->credit = draft.credit;
  uow.put(*current);
  touch_transaction(uow, previous);
  touch_transaction(uow, draft.transaction);
  if (auto status = uow.commit(); !status.ok()) {
    return count(EntryResult::failure(std::move(status)));
  }
  return count(EntryResult::success(std::move(*current)));
}

common::Status EntryValidator::remove(common::EntryId id) {
  store::UnitOfWork uow(store_);
  auto current = uow.get<store::EntryRow>(id);
  if (!current) {
    return unknown_entry(id);
  }
  uow.serialize_on<store::TransactionRow>(current->transaction);
  current = uow.get<store::EntryRow>(id);
  if (!current) {
    return unknown_entry(id);
  }
  uow.erase<store::EntryRow>(id);
  touch_transaction(uow, current->transaction);
  return uow.commit();
}

EntryResult EntryValidator::get(common::EntryId id) const {
  return store_.read([&](const store::Tables& tables) {
    if (const auto* row = tables.entries.find(id)) {
      return EntryResult::success(*row);
    }
    return EntryResult::failure(unknown_entry(id));
  });
}

std::vector<store::EntryRow> EntryValidator::list(const EntryFilter& filter) const {
  return store_.read([&](const store::Tables& tables) {
    std::vector<store::EntryRow> out;
    tables.entries.for_each([&](const store::EntryRow& row) {
      if (filter.transaction && row.transaction != *filter.transaction) {
        return;
      }
      if (filter.account && row.account != *filter.account) {
        return;
      }
      out.push_back(row);
    });
    return out;
  });
}

}  // namespace ledger
}  // namespace ledgercore
