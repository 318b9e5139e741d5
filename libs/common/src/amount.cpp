#include "ledgercore/common/amount.hpp"

#include <cstdlib>
#include <limits>

namespace ledgercore {
namespace common {

namespace {

constexpr std::int64_t kBasisPointDenominator = 10'000;

bool checked_mul(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept {
  if (a == 0 || b == 0) {
    out = 0;
    return true;
  }
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  if (a == std::numeric_limits<std::int64_t>::min() || b == std::numeric_limits<std::int64_t>::min()) {
    return false;
  }
  if (std::llabs(a) > kMax / std::llabs(b)) {
    return false;
  }
  out = a * b;
  return true;
}

// Integer division rounding half away from zero; denominator is positive.
std::int64_t divide_round(std::int64_t numerator, std::int64_t denominator) noexcept {
  const std::int64_t quotient = numerator / denominator;
  const std::int64_t remainder = numerator % denominator;
  if (std::llabs(remainder) * 2 >= denominator) {
    return numerator < 0 ? quotient - 1 : quotient + 1;
  }
  return quotient;
}

std::optional<Amount> scaled_product(std::int64_t a, std::int64_t b, std::int64_t denominator) noexcept {
  std::int64_t product = 0;
  if (!checked_mul(a, b, product)) {
    return std::nullopt;
  }
  return Amount::from_cents(divide_round(product, denominator));
}

}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  std::size_t pos = 0;
  if (text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    ++pos;
  }

  std::int64_t whole = 0;
  std::int64_t fraction = 0;
  int fraction_digits = 0;
  bool seen_digit = false;
  bool seen_point = false;
  constexpr auto kLimit = std::numeric_limits<std::int64_t>::max() / (kScale * 10);

  for (; pos < text.size(); ++pos) {
    const char ch = text[pos];
    if (ch == '.') {
      if (seen_point) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    seen_digit = true;
    if (seen_point) {
      if (++fraction_digits > 2) {
        return std::nullopt;
      }
      fraction = fraction * 10 + (ch - '0');
    } else {
      if (whole > kLimit) {
        return std::nullopt;
      }
      whole = whole * 10 + (ch - '0');
    }
  }

  if (!seen_digit) {
    return std::nullopt;
  }
  if (fraction_digits == 1) {
    fraction *= 10;
  }

  if (whole > (std::numeric_limits<std::int64_t>::max() - fraction) / kScale) {
    return std::nullopt;
  }
  const std::int64_t cents = whole * kScale + fraction;
  return Amount{negative ? -cents : cents};
}

std::string Amount::to_string() const {
  const bool negative = cents_ < 0;
  // Widen before negating so the most negative value formats correctly.
  const auto magnitude = negative ? static_cast<std::uint64_t>(-(cents_ + 1)) + 1
                                  : static_cast<std::uint64_t>(cents_);
  const auto whole = magnitude / static_cast<std::uint64_t>(kScale);
  const auto fraction = magnitude % static_cast<std::uint64_t>(kScale);

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  out.push_back('.');
  out.push_back(static_cast<char>('0' + fraction / 10));
  out.push_back(static_cast<char>('0' + fraction % 10));
  return out;
}

std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if (rhs.cents() > 0 && lhs.cents() > kMax - rhs.cents()) {
    return std::nullopt;
  }
  if (rhs.cents() < 0 && lhs.cents() < kMin - rhs.cents()) {
    return std::nullopt;
  }
  return lhs + rhs;
}

std::optional<Amount> multiply(Amount a, Amount b) noexcept {
  return scaled_product(a.cents(), b.cents(), Amount::kScale);
}

std::optional<Amount> apply_percentage(Amount base, Amount percent) noexcept {
  // percent carries two decimals, so 100 % is 10'000 in cents.
  return scaled_product(base.cents(), percent.cents(), 100 * Amount::kScale);
}

std::optional<Amount> apply_basis_points(Amount base, std::int32_t basis_points) noexcept {
  return scaled_product(base.cents(), basis_points, kBasisPointDenominator);
}

}  // namespace common
}  // namespace ledgercore
