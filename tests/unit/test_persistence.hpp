#pragma once

namespace ledgercore::tests {

void test_journal_records();
void test_journal_corruption();
void test_persistence_replay();

}  // namespace ledgercore::tests
