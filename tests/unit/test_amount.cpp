#include "test_amount.hpp"

#include <cassert>
#include <cstdint>
#include <limits>

#include "ledgercore/common/amount.hpp"

namespace ledgercore::tests {

void test_amount_parse_and_format() {
  using common::Amount;

  assert(Amount::parse("12")->cents() == 1'200);
  assert(Amount::parse("12.5")->cents() == 1'250);
  assert(Amount::parse("-0.75")->cents() == -75);
  assert(!Amount::parse("1.234").has_value());
  assert(!Amount::parse("").has_value());
  assert(!Amount::parse("1.2.3").has_value());
  assert(!Amount::parse("abc").has_value());

  // Largest representable value parses, one digit more does not.
  assert(Amount::parse("92233720368547758.07")->cents() == std::numeric_limits<std::int64_t>::max());
  assert(!Amount::parse("92233720368547758.08").has_value());
  assert(!Amount::parse("92233720368547759").has_value());
  assert(!Amount::parse("-92233720368547759").has_value());

  assert(Amount::from_cents(5'085).to_string() == "50.85");
  assert(Amount::from_cents(-5).to_string() == "-0.05");
  assert(Amount::from_units(100).to_string() == "100.00");

  assert(Amount::from_cents(1'000) + Amount::from_cents(-250) == Amount::from_cents(750));
  assert(Amount::from_cents(100) > Amount::from_cents(99));

  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  assert(common::checked_add(Amount::from_cents(kMax - 1), Amount::from_cents(1))->cents() == kMax);
  assert(!common::checked_add(Amount::from_cents(kMax), Amount::from_cents(1)).has_value());
  assert(!common::checked_add(Amount::from_cents(kMin), Amount::from_cents(-1)).has_value());
  assert(common::checked_add(Amount::from_cents(kMin), Amount::from_cents(1))->cents() == kMin + 1);
}

void test_amount_rounding() {
  using common::Amount;

  // 2 x 25.00
  assert(common::multiply(Amount::from_units(2), Amount::from_units(25))->cents() == 5'000);
  // 0.333 rounds to 0.33, 0.335 rounds half away from zero to 0.34
  assert(common::multiply(Amount::from_cents(33), Amount::from_cents(101))->cents() == 33);
  assert(common::multiply(Amount::from_cents(67), Amount::from_cents(50))->cents() == 34);
  assert(common::multiply(Amount::from_cents(-67), Amount::from_cents(50))->cents() == -34);

  // 10 % of 50.00
  assert(common::apply_percentage(Amount::from_units(50), Amount::from_units(10))->cents() == 500);
  // 13 % of 45.00 is 5.85
  assert(common::apply_basis_points(Amount::from_units(45), 1'300)->cents() == 585);
  // 13 % of 0.05 is 0.0065, rounds to 0.01
  assert(common::apply_basis_points(Amount::from_cents(5), 1'300)->cents() == 1);

  const auto huge = Amount::from_cents(std::numeric_limits<std::int64_t>::max() / 2);
  assert(!common::multiply(huge, Amount::from_units(3)).has_value());
}

}  // namespace ledgercore::tests
