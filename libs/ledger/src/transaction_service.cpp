#include "ledgercore/ledger/transaction_service.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "ledgercore/common/time_utils.hpp"
#include "ledgercore/store/unit_of_work.hpp"

namespace ledgercore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeInvalidTransaction = 2001;
constexpr std::uint16_t kRejectCodeUnknownPeriod = 2002;
constexpr std::uint16_t kRejectCodeUnknownTransaction = 2003;
constexpr std::uint16_t kRejectCodeHasEntries = 2004;
constexpr std::uint16_t kRejectCodeInvoiced = 2005;

using TransactionResult = common::Result<store::TransactionRow>;

common::Status invalid(std::string message) {
  return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidTransaction, std::move(message));
}

common::Status unknown_transaction(common::TransactionId id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownTransaction,
                        "transaction " + std::to_string(id) + " does not exist");
}

bool is_currency_code(const std::string& code) {
  return code.size() == 3 && std::all_of(code.begin(), code.end(), [](char ch) {
           return std::isupper(static_cast<unsigned char>(ch)) != 0;
         });
}

common::Status check_draft(const TransactionDraft& draft, const std::string& currency) {
  if (draft.description.empty()) {
    return invalid("transaction description is required");
  }
  if (draft.created_by.empty()) {
    return invalid("transaction creator is required");
  }
  if (!is_currency_code(currency)) {
    return invalid("currency must be a three letter upper-case code, got \"" + currency + "\"");
  }
  return common::ok_status();
}

common::Status check_period(const store::UnitOfWork& uow, common::PeriodId period) {
  if (!uow.contains<store::PeriodRow>(period)) {
    return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownPeriod,
                          "period " + std::to_string(period) + " does not exist");
  }
  return common::ok_status();
}

}  // namespace

TransactionService::TransactionService(store::Store& store, TransactionOptions options)
    : store_(store), options_(std::move(options)) {}

TransactionResult TransactionService::create(const TransactionDraft& draft) {
  const std::string currency = draft.currency.value_or(options_.default_currency);
  if (auto status = check_draft(draft, currency); !status.ok()) {
    return TransactionResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  if (auto status = check_period(uow, draft.period); !status.ok()) {
    return TransactionResult::failure(std::move(status));
  }

  store::TransactionRow row{
      .id = uow.next_id<store::TransactionRow>(),
      .occurred_at = draft.occurred_at,
      .description = draft.description,
      .kind = draft.kind,
      .currency = currency,
      .created_at = common::now_system(),
      .created_by = draft.created_by,
      .period = draft.period,
  };
  uow.put(row);
  if (auto status = uow.commit(); !status.ok()) {
    return TransactionResult::failure(std::move(status));
  }
  return TransactionResult::success(std::move(row));
}

TransactionResult TransactionService::update(common::TransactionId id, const TransactionDraft& draft) {
  store::UnitOfWork uow(store_);
  uow.serialize_on<store::TransactionRow>(id);

  auto row = uow.get<store::TransactionRow>(id);
  if (!row) {
    return TransactionResult::failure(unknown_transaction(id));
  }
  const std::string currency = draft.currency.value_or(row->currency);
  if (auto status = check_draft(draft, currency); !status.ok()) {
    return TransactionResult::failure(std::move(status));
  }
  if (auto status = check_period(uow, draft.period); !status.ok()) {
    return TransactionResult::failure(std::move(status));
  }

  row->occurred_at = draft.occurred_at;
  row->description = draft.description;
  row->kind = draft.kind;
  row->currency = currency;
  row->created_by = draft.created_by;
  row->period = draft.period;
  uow.put(*row);
  if (auto status = uow.commit(); !status.ok()) {
    return TransactionResult::failure(std::move(status));
  }
  return TransactionResult::success(std::move(*row));
}

common::Status TransactionService::remove(common::TransactionId id) {
  return remove(id, options_.delete_policy);
}

common::Status TransactionService::remove(common::TransactionId id, common::DeletionPolicy policy) {
  store::UnitOfWork uow(store_);
  uow.serialize_on<store::TransactionRow>(id);

  if (!uow.contains<store::TransactionRow>(id)) {
    return unknown_transaction(id);
  }

  const auto invoiced = uow.select<store::InvoiceRow>([id](const store::InvoiceRow& row) {
    return row.transaction == id;
  });
  if (!invoiced.empty()) {
    return common::reject(common::ErrorKind::kReferentialIntegrity, kRejectCodeInvoiced,
                          "transaction " + std::to_string(id) + " is referenced by invoice " + invoiced.front().number);
  }

  const auto entries = uow.select<store::EntryRow>([id](const store::EntryRow& row) { return row.transaction == id; });
  if (!entries.empty()) {
    if (policy == common::DeletionPolicy::kReject) {
      return common::reject(common::ErrorKind::kReferentialIntegrity, kRejectCodeHasEntries,
                            "transaction " + std::to_string(id) + " still has " + std::to_string(entries.size()) +
                                " ledger entries");
    }
    for (const auto& entry : entries) {
      uow.erase<store::EntryRow>(entry.id);
    }
  }

  uow.erase<store::TransactionRow>(id);
  return uow.commit();
}

TransactionResult TransactionService::get(common::TransactionId id) const {
  return store_.read([&](const store::Tables& tables) {
    if (const auto* row = tables.transactions.find(id)) {
      return TransactionResult::success(*row);
    }
    return TransactionResult::failure(unknown_transaction(id));
  });
}

std::vector<store::TransactionRow> TransactionService::list(const TransactionFilter& filter) const {
  auto rows = store_.read([&](const store::Tables& tables) {
    std::vector<store::TransactionRow> out;
    tables.transactions.for_each([&](const store::TransactionRow& row) {
      const auto day = common::date_of(row.occurred_at);
      if (filter.from && day < *filter.from) {
        return;
      }
      if (filter.to && day > *filter.to) {
        return;
      }
      if (filter.period && row.period != *filter.period) {
        return;
      }
      if (filter.kind && row.kind != *filter.kind) {
        return;
      }
      out.push_back(row);
    });
    return out;
  });
  // Most recent first, as the reporting screens list them.
  std::stable_sort(rows.begin(), rows.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.occurred_at > rhs.occurred_at;
  });
  return common::slice(std::move(rows), filter.page);
}

}  // namespace ledger
}  // namespace ledgercore
