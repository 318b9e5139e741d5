#pragma once

namespace ledgercore::tests {

void test_amount_parse_and_format();
void test_amount_rounding();

}  // namespace ledgercore::tests
