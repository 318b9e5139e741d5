#include "ledgercore/common/types.hpp"

#include "ledgercore/common/status.hpp"

namespace ledgercore {
namespace common {

std::string_view to_string(AccountClass value) noexcept {
  switch (value) {
    case AccountClass::kAsset:
      return "asset";
    case AccountClass::kLiability:
      return "liability";
    case AccountClass::kEquity:
      return "equity";
    case AccountClass::kIncome:
      return "income";
    case AccountClass::kExpense:
      return "expense";
  }
  return "unknown";
}

std::string_view to_string(PeriodKind value) noexcept {
  switch (value) {
    case PeriodKind::kMonthly:
      return "monthly";
    case PeriodKind::kQuarterly:
      return "quarterly";
    case PeriodKind::kAnnual:
      return "annual";
  }
  return "unknown";
}

std::string_view to_string(PeriodState value) noexcept {
  return value == PeriodState::kOpen ? "open" : "closed";
}

std::string_view to_string(TransactionKind value) noexcept {
  return value == TransactionKind::kIncome ? "income" : "expense";
}

std::string_view to_string(ProductKind value) noexcept {
  return value == ProductKind::kProduct ? "product" : "service";
}

std::string_view to_string(ClientKind value) noexcept {
  return value == ClientKind::kIndividual ? "individual" : "company";
}

std::string_view to_string(ConcurrencyMode value) noexcept {
  return value == ConcurrencyMode::kLocking ? "locking" : "optimistic";
}

std::string_view to_string(DeletionPolicy value) noexcept {
  return value == DeletionPolicy::kReject ? "reject" : "cascade";
}

std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNone:
      return "ok";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kConstraintViolation:
      return "constraint_violation";
    case ErrorKind::kConcurrencyConflict:
      return "concurrency_conflict";
    case ErrorKind::kReferentialIntegrity:
      return "referential_integrity";
  }
  return "unknown";
}

std::optional<AccountClass> parse_account_class(std::string_view text) noexcept {
  for (auto candidate : {AccountClass::kAsset, AccountClass::kLiability, AccountClass::kEquity,
                         AccountClass::kIncome, AccountClass::kExpense}) {
    if (to_string(candidate) == text) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::optional<ConcurrencyMode> parse_concurrency_mode(std::string_view text) noexcept {
  if (text == "locking") {
    return ConcurrencyMode::kLocking;
  }
  if (text == "optimistic") {
    return ConcurrencyMode::kOptimistic;
  }
  return std::nullopt;
}

std::optional<DeletionPolicy> parse_deletion_policy(std::string_view text) noexcept {
  if (text == "reject") {
    return DeletionPolicy::kReject;
  }
  if (text == "cascade") {
    return DeletionPolicy::kCascade;
  }
  return std::nullopt;
}

}  // namespace common
}  // namespace ledgercore
