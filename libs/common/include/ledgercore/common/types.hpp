#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ledgercore {
namespace common {

using AccountId = std::uint32_t;
using PeriodId = std::uint32_t;
using TransactionId = std::uint64_t;
using EntryId = std::uint64_t;
using ProductId = std::uint32_t;
using ClientId = std::uint32_t;
using LineId = std::uint64_t;
using InvoiceId = std::string;  // opaque token, see identity::TokenGenerator

using Timestamp = std::chrono::sys_seconds;
using Date = std::chrono::sys_days;

enum class AccountClass : std::uint8_t {
  kAsset,
  kLiability,
  kEquity,
  kIncome,
  kExpense,
};

enum class PeriodKind : std::uint8_t {
  kMonthly,
  kQuarterly,
  kAnnual,
};

enum class PeriodState : std::uint8_t {
  kOpen,
  kClosed,
};

enum class TransactionKind : std::uint8_t {
  kIncome,
  kExpense,
};

enum class ProductKind : std::uint8_t {
  kProduct,
  kService,
};

enum class ClientKind : std::uint8_t {
  kIndividual,
  kCompany,
};

// How aggregate recomputation is serialized against concurrent writers.
enum class ConcurrencyMode : std::uint8_t {
  kLocking,     // per-parent row lock held for the whole unit of work
  kOptimistic,  // parent version checked at commit, conflict returned to caller
};

// What removing a transaction does with its ledger entries.
enum class DeletionPolicy : std::uint8_t {
  kReject,
  kCascade,
};

std::string_view to_string(AccountClass value) noexcept;
std::string_view to_string(PeriodKind value) noexcept;
std::string_view to_string(PeriodState value) noexcept;
std::string_view to_string(TransactionKind value) noexcept;
std::string_view to_string(ProductKind value) noexcept;
std::string_view to_string(ClientKind value) noexcept;
std::string_view to_string(ConcurrencyMode value) noexcept;
std::string_view to_string(DeletionPolicy value) noexcept;

std::optional<AccountClass> parse_account_class(std::string_view text) noexcept;
std::optional<ConcurrencyMode> parse_concurrency_mode(std::string_view text) noexcept;
std::optional<DeletionPolicy> parse_deletion_policy(std::string_view text) noexcept;

}  // namespace common
}  // namespace ledgercore
