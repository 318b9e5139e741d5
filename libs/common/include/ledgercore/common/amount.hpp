#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ledgercore {
namespace common {

// Signed decimal with exactly two fractional digits, stored as cents.
// Mirrors the NUMERIC(p,2) columns of the ledger and invoice tables, so
// equality is exact and never tolerance based.
class Amount {
 public:
  static constexpr std::int64_t kScale = 100;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_cents(std::int64_t cents) noexcept {
    return Amount{cents};
  }
  [[nodiscard]] static constexpr Amount from_units(std::int64_t units) noexcept {
    return Amount{units * kScale};
  }
  // Accepts "12", "12.5", "-0.75". More than two fractional digits is rejected.
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t cents() const noexcept { return cents_; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return cents_ == 0; }
  [[nodiscard]] constexpr bool is_positive() const noexcept { return cents_ > 0; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return cents_ < 0; }

  [[nodiscard]] std::string to_string() const;

  constexpr Amount operator-() const noexcept { return Amount{-cents_}; }
  constexpr Amount operator+(Amount other) const noexcept { return Amount{cents_ + other.cents_}; }
  constexpr Amount operator-(Amount other) const noexcept { return Amount{cents_ - other.cents_}; }
  constexpr Amount& operator+=(Amount other) noexcept {
    cents_ += other.cents_;
    return *this;
  }
  constexpr Amount& operator-=(Amount other) noexcept {
    cents_ -= other.cents_;
    return *this;
  }

  constexpr auto operator<=>(const Amount&) const noexcept = default;

 private:
  explicit constexpr Amount(std::int64_t cents) noexcept : cents_(cents) {}

  std::int64_t cents_{0};
};

// lhs + rhs. Empty on overflow.
[[nodiscard]] std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept;

// a * b rounded half away from zero to cents. Empty on overflow.
[[nodiscard]] std::optional<Amount> multiply(Amount a, Amount b) noexcept;

// base * percent / 100, rounded half away from zero. Empty on overflow.
[[nodiscard]] std::optional<Amount> apply_percentage(Amount base, Amount percent) noexcept;

// base * basis_points / 10'000, rounded half away from zero. Empty on overflow.
[[nodiscard]] std::optional<Amount> apply_basis_points(Amount base, std::int32_t basis_points) noexcept;

}  // namespace common
}  // namespace ledgercore
