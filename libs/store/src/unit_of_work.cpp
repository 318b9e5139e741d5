#include "ledgercore/store/unit_of_work.hpp"

namespace ledgercore {
namespace store {

void UnitOfWork::lock(LockScope scope, const std::string& key) {
  if (!held_.emplace(scope, key).second) {
    return;
  }
  locks_.push_back(store_.lock_row(scope, key));
}

common::Status UnitOfWork::commit() {
  if (finished_) {
    return common::reject(common::ErrorKind::kConstraintViolation, codes::kUnitFinished,
                          "unit of work already committed or rolled back");
  }
  auto status = store_.commit(staged_, guards_);
  rollback();
  return status;
}

void UnitOfWork::rollback() noexcept {
  finished_ = true;
  staged_.clear();
  guards_.clear();
  locks_.clear();
  held_.clear();
}

}  // namespace store
}  // namespace ledgercore
