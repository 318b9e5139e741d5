#pragma once

namespace ledgercore::tests {

void test_unit_of_work_isolation();
void test_commit_integrity();
void test_commit_guards();
void test_change_set_codec();

}  // namespace ledgercore::tests
