#include "ledgercore/catalog/period_registry.hpp"

#include "ledgercore/store/unit_of_work.hpp"

namespace ledgercore {
namespace catalog {

namespace {
constexpr std::uint16_t kRejectCodeInvalidRange = 1101;
constexpr std::uint16_t kRejectCodeUnknownPeriod = 1102;

using PeriodResult = common::Result<store::PeriodRow>;

common::Status unknown_period(common::PeriodId id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownPeriod,
                        "period " + std::to_string(id) + " does not exist");
}

common::Status check_range(const PeriodDraft& draft) {
  if (draft.start > draft.end) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidRange,
                          "period start must not be after its end");
  }
  return common::ok_status();
}

template <typename Pred>
std::vector<store::PeriodRow> collect(const store::Store& store, Pred&& pred) {
  return store.read([&](const store::Tables& tables) {
    std::vector<store::PeriodRow> out;
    tables.periods.for_each([&](const store::PeriodRow& row) {
      if (pred(row)) {
        out.push_back(row);
      }
    });
    return out;
  });
}

}  // namespace

PeriodResult PeriodRegistry::create(const PeriodDraft& draft) {
  if (auto status = check_range(draft); !status.ok()) {
    return PeriodResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  store::PeriodRow row{
      .id = uow.next_id<store::PeriodRow>(),
      .start = draft.start,
      .end = draft.end,
      .kind = draft.kind,
      .state = draft.state,
  };
  uow.put(row);
  if (auto status = uow.commit(); !status.ok()) {
    return PeriodResult::failure(std::move(status));
  }
  return PeriodResult::success(std::move(row));
}

PeriodResult PeriodRegistry::update(common::PeriodId id, const PeriodDraft& draft) {
  if (auto status = check_range(draft); !status.ok()) {
    return PeriodResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  auto row = uow.get<store::PeriodRow>(id);
  if (!row) {
    return PeriodResult::failure(unknown_period(id));
  }
  row->start = draft.start;
  row->end = draft.end;
  row->kind = draft.kind;
  row->state = draft.state;
  uow.put(*row);
  if (auto status = uow.commit(); !status.ok()) {
    return PeriodResult::failure(std::move(status));
  }
  return PeriodResult::success(std::move(*row));
}

common::Status PeriodRegistry::remove(common::PeriodId id) {
  store::UnitOfWork uow(store_);
  if (!uow.contains<store::PeriodRow>(id)) {
    return unknown_period(id);
  }
  // Transactions still pointing at the period make the commit fail with
  // ReferentialIntegrity.
  uow.erase<store::PeriodRow>(id);
  return uow.commit();
}

PeriodResult PeriodRegistry::get(common::PeriodId id) const {
  return store_.read([&](const store::Tables& tables) {
    if (const auto* row = tables.periods.find(id)) {
      return PeriodResult::success(*row);
    }
    return PeriodResult::failure(unknown_period(id));
  });
}

std::vector<store::PeriodRow> PeriodRegistry::list(common::Page page) const {
  return common::slice(collect(store_, [](const store::PeriodRow&) { return true; }), page);
}

std::vector<store::PeriodRow> PeriodRegistry::list_open() const {
  return collect(store_, [](const store::PeriodRow& row) { return row.state == common::PeriodState::kOpen; });
}

}  // namespace catalog
}  // namespace ledgercore
