#pragma once

#include <cstdint>
#include <optional>

#include "ledgercore/common/amount.hpp"
#include "ledgercore/common/status.hpp"

namespace ledgercore {
namespace invoice {

struct LineInput {
  common::Amount quantity{};
  common::Amount unit_price{};
  std::optional<common::Amount> discount_percentage;
  std::optional<common::Amount> discount_amount;
  bool taxable{true};
};

struct LineAggregate {
  common::Amount discount_amount{};
  common::Amount subtotal{};
  common::Amount tax{};
  common::Amount total{};
};

// Derived money fields of one invoice line. Pure: the same input always
// produces the same aggregate, so it is re-run on every line update.
//
//   raw      = quantity * unit_price
//   discount = raw * pct / 100 when pct > 0, else the given amount
//   subtotal = raw - discount            (negative is rejected)
//   tax      = subtotal * rate           (0 for untaxed products)
//   total    = subtotal + tax
class LineAggregator {
 public:
  static constexpr std::int32_t kDefaultTaxRateBasisPoints = 1300;

  explicit LineAggregator(std::int32_t tax_rate_basis_points = kDefaultTaxRateBasisPoints) noexcept
      : tax_rate_basis_points_(tax_rate_basis_points) {}

  [[nodiscard]] common::Result<LineAggregate> compute_line(const LineInput& input) const;

  [[nodiscard]] std::int32_t tax_rate_basis_points() const noexcept { return tax_rate_basis_points_; }

 private:
  std::int32_t tax_rate_basis_points_;
};

}  // namespace invoice
}  // namespace ledgercore
