#include "ledgercore/invoice/line_aggregator.hpp"

namespace ledgercore {
namespace invoice {

namespace {
constexpr std::uint16_t kRejectCodeInvalidQuantity = 3101;
constexpr std::uint16_t kRejectCodeNegativePrice = 3102;
constexpr std::uint16_t kRejectCodeInvalidPercentage = 3103;
constexpr std::uint16_t kRejectCodeNegativeDiscount = 3104;
constexpr std::uint16_t kRejectCodeNegativeSubtotal = 3105;
constexpr std::uint16_t kRejectCodeOverflow = 3106;

constexpr common::Amount kHundredPercent = common::Amount::from_units(100);

using AggregateResult = common::Result<LineAggregate>;

AggregateResult violation(std::uint16_t code, std::string message) {
  return AggregateResult::failure(common::reject(common::ErrorKind::kConstraintViolation, code, std::move(message)));
}

}  // namespace

AggregateResult LineAggregator::compute_line(const LineInput& input) const {
  if (!input.quantity.is_positive()) {
    return violation(kRejectCodeInvalidQuantity, "quantity must be greater than zero");
  }
  if (input.unit_price.is_negative()) {
    return violation(kRejectCodeNegativePrice, "unit price must not be negative");
  }
  if (input.discount_percentage &&
      (input.discount_percentage->is_negative() || *input.discount_percentage > kHundredPercent)) {
    return violation(kRejectCodeInvalidPercentage, "discount percentage must be between 0 and 100");
  }
  if (input.discount_amount && input.discount_amount->is_negative()) {
    return violation(kRejectCodeNegativeDiscount, "discount amount must not be negative");
  }

  const auto raw = common::multiply(input.quantity, input.unit_price);
  if (!raw) {
    return violation(kRejectCodeOverflow, "line amount is out of range");
  }

  LineAggregate line;
  if (input.discount_percentage && input.discount_percentage->is_positive()) {
    const auto discount = common::apply_percentage(*raw, *input.discount_percentage);
    if (!discount) {
      return violation(kRejectCodeOverflow, "line discount is out of range");
    }
    line.discount_amount = *discount;
  } else if (input.discount_amount) {
    line.discount_amount = *input.discount_amount;
  }

  line.subtotal = *raw - line.discount_amount;
  if (line.subtotal.is_negative()) {
    return violation(kRejectCodeNegativeSubtotal,
                     "discount " + line.discount_amount.to_string() + " exceeds line amount " + raw->to_string());
  }

  if (input.taxable) {
    const auto tax = common::apply_basis_points(line.subtotal, tax_rate_basis_points_);
    if (!tax) {
      return violation(kRejectCodeOverflow, "line tax is out of range");
    }
    line.tax = *tax;
  }

  const auto total = common::checked_add(line.subtotal, line.tax);
  if (!total) {
    return violation(kRejectCodeOverflow, "line total is out of range");
  }
  line.total = *total;
  return AggregateResult::success(line);
}

}  // namespace invoice
}  // namespace ledgercore
