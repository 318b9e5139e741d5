#pragma once

namespace ledgercore::tests {

void test_config_defaults();
void test_config_overrides();
void test_config_validation();

}  // namespace ledgercore::tests
