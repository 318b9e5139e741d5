#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ledgercore/common/paging.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace catalog {

struct AccountDraft {
  std::string code;
  std::string name;
  common::AccountClass classification{common::AccountClass::kAsset};
};

// Chart of accounts. An account becomes immutable as soon as any ledger
// entry references it.
class AccountCatalog {
 public:
  explicit AccountCatalog(store::Store& store) : store_(store) {}

  common::Result<store::AccountRow> create(const AccountDraft& draft);
  common::Result<store::AccountRow> update(common::AccountId id, const AccountDraft& draft);
  common::Status remove(common::AccountId id);

  [[nodiscard]] common::Result<store::AccountRow> get(common::AccountId id) const;
  [[nodiscard]] common::Result<store::AccountRow> find_by_code(std::string_view code) const;
  [[nodiscard]] std::vector<store::AccountRow> list(common::Page page = {}) const;
  [[nodiscard]] bool is_referenced(common::AccountId id) const;

 private:
  store::Store& store_;
};

}  // namespace catalog
}  // namespace ledgercore
