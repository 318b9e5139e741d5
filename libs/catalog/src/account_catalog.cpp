#include "ledgercore/catalog/account_catalog.hpp"

#include "ledgercore/store/unit_of_work.hpp"

namespace ledgercore {
namespace catalog {

namespace {
constexpr std::uint16_t kRejectCodeInvalidAccount = 1001;
constexpr std::uint16_t kRejectCodeDuplicateCode = 1002;
constexpr std::uint16_t kRejectCodeUnknownAccount = 1003;
constexpr std::uint16_t kRejectCodeAccountInUse = 1004;

using AccountResult = common::Result<store::AccountRow>;

common::Status check_draft(const AccountDraft& draft) {
  if (draft.code.empty()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidAccount, "account code is required");
  }
  if (draft.name.empty()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidAccount, "account name is required");
  }
  return common::ok_status();
}

common::Status unknown_account(common::AccountId id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownAccount,
                        "account " + std::to_string(id) + " does not exist");
}

common::Status account_in_use(common::AccountId id) {
  return common::reject(common::ErrorKind::kReferentialIntegrity, kRejectCodeAccountInUse,
                        "account " + std::to_string(id) + " is referenced by ledger entries");
}

bool code_taken(const store::UnitOfWork& uow, const std::string& code, common::AccountId self) {
  return !uow.select<store::AccountRow>([&](const store::AccountRow& row) {
               return row.id != self && row.code == code;
             }).empty();
}

bool referenced_by_entries(const store::Tables& tables, common::AccountId id) {
  bool found = false;
  tables.entries.for_each([&](const store::EntryRow& entry) {
    found = found || entry.account == id;
  });
  return found;
}

}  // namespace

AccountResult AccountCatalog::create(const AccountDraft& draft) {
  if (auto status = check_draft(draft); !status.ok()) {
    return AccountResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  if (code_taken(uow, draft.code, 0)) {
    return AccountResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeDuplicateCode,
                                                 "account code " + draft.code + " already exists"));
  }

  store::AccountRow row{
      .id = uow.next_id<store::AccountRow>(),
      .code = draft.code,
      .name = draft.name,
      .classification = draft.classification,
  };
  uow.put(row);
  if (auto status = uow.commit(); !status.ok()) {
    return AccountResult::failure(std::move(status));
  }
  return AccountResult::success(std::move(row));
}

AccountResult AccountCatalog::update(common::AccountId id, const AccountDraft& draft) {
  if (auto status = check_draft(draft); !status.ok()) {
    return AccountResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  auto existing = uow.get<store::AccountRow>(id);
  if (!existing) {
    return AccountResult::failure(unknown_account(id));
  }
  if (is_referenced(id)) {
    return AccountResult::failure(account_in_use(id));
  }
  if (code_taken(uow, draft.code, id)) {
    return AccountResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeDuplicateCode,
                                                 "account code " + draft.code + " already exists"));
  }

  existing->code = draft.code;
  existing->name = draft.name;
  existing->classification = draft.classification;
  uow.put(*existing);
  // An entry may start referencing the account between the check above and
  // the commit.
  uow.add_guard([id](const store::CommitView& view) {
    if (view.any<store::EntryRow>([id](const store::EntryRow& entry) { return entry.account == id; })) {
      return account_in_use(id);
    }
    return common::ok_status();
  });
  if (auto status = uow.commit(); !status.ok()) {
    return AccountResult::failure(std::move(status));
  }
  return AccountResult::success(std::move(*existing));
}

common::Status AccountCatalog::remove(common::AccountId id) {
  store::UnitOfWork uow(store_);
  if (!uow.contains<store::AccountRow>(id)) {
    return unknown_account(id);
  }
  if (is_referenced(id)) {
    return account_in_use(id);
  }
  uow.erase<store::AccountRow>(id);
  return uow.commit();
}

AccountResult AccountCatalog::get(common::AccountId id) const {
  return store_.read([&](const store::Tables& tables) {
    if (const auto* row = tables.accounts.find(id)) {
      return AccountResult::success(*row);
    }
    return AccountResult::failure(unknown_account(id));
  });
}

AccountResult AccountCatalog::find_by_code(std::string_view code) const {
  return store_.read([&](const store::Tables& tables) {
    const store::AccountRow* match = nullptr;
    tables.accounts.for_each([&](const store::AccountRow& row) {
      if (!match && row.code == code) {
        match = &row;
      }
    });
    if (match) {
      return AccountResult::success(*match);
    }
    return AccountResult::failure(common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownAccount,
                                                 "account code " + std::string(code) + " does not exist"));
  });
}

std::vector<store::AccountRow> AccountCatalog::list(common::Page page) const {
  auto rows = store_.read([](const store::Tables& tables) {
    std::vector<store::AccountRow> out;
    out.reserve(tables.accounts.size());
    tables.accounts.for_each([&](const store::AccountRow& row) { out.push_back(row); });
    return out;
  });
  return common::slice(std::move(rows), page);
}

bool AccountCatalog::is_referenced(common::AccountId id) const {
  return store_.read([id](const store::Tables& tables) { return referenced_by_entries(tables, id); });
}

}  // namespace catalog
}  // namespace ledgercore
