#pragma once

#include <vector>

#include "ledgercore/common/paging.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace catalog {

struct PeriodDraft {
  common::Date start{};
  common::Date end{};
  common::PeriodKind kind{common::PeriodKind::kMonthly};
  common::PeriodState state{common::PeriodState::kOpen};
};

// Accounting periods. State is recorded but not enforced on transactions.
class PeriodRegistry {
 public:
  explicit PeriodRegistry(store::Store& store) : store_(store) {}

  common::Result<store::PeriodRow> create(const PeriodDraft& draft);
  common::Result<store::PeriodRow> update(common::PeriodId id, const PeriodDraft& draft);
  common::Status remove(common::PeriodId id);

  [[nodiscard]] common::Result<store::PeriodRow> get(common::PeriodId id) const;
  [[nodiscard]] std::vector<store::PeriodRow> list(common::Page page = {}) const;
  [[nodiscard]] std::vector<store::PeriodRow> list_open() const;

 private:
  store::Store& store_;
};

}  // namespace catalog
}  // namespace ledgercore
