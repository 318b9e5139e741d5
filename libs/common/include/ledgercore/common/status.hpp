#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ledgercore {
namespace common {

enum class ErrorKind : std::uint8_t {
  kNone,
  kNotFound,
  kConstraintViolation,
  kConcurrencyConflict,
  kReferentialIntegrity,
};

std::string_view to_string(ErrorKind kind) noexcept;

// Outcome of a domain operation. Rejections carry a per-module numeric code
// (catalog 1xxx, ledger 2xxx, invoice 3xxx, store 4xxx) and a message meant
// to be shown to the caller unchanged.
struct Status {
  ErrorKind kind{ErrorKind::kNone};
  std::uint16_t reject_code{0};
  std::string message{};

  [[nodiscard]] bool ok() const noexcept { return kind == ErrorKind::kNone; }
};

inline Status ok_status() { return Status{}; }

inline Status reject(ErrorKind kind, std::uint16_t code, std::string message) {
  return Status{.kind = kind, .reject_code = code, .message = std::move(message)};
}

template <typename T>
struct Result {
  Status status{};
  std::optional<T> value{};

  [[nodiscard]] bool ok() const noexcept { return status.ok(); }

  static Result success(T v) { return Result{.status = Status{}, .value = std::move(v)}; }
  static Result failure(Status s) { return Result{.status = std::move(s), .value = std::nullopt}; }
};

}  // namespace common
}  // namespace ledgercore
