#pragma once

namespace ledgercore::tests {

void test_concurrent_lines_locking();
void test_concurrent_lines_optimistic();
void test_optimistic_conflict_reported();
void test_optimistic_entry_conflict();
void test_concurrent_entries();

}  // namespace ledgercore::tests
