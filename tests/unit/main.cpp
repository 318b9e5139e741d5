// Unit test runner - calls test functions from per-component test files

#include "test_amount.hpp"
#include "test_catalog.hpp"
#include "test_concurrency.hpp"
#include "test_config.hpp"
#include "test_identity.hpp"
#include "test_invoice.hpp"
#include "test_ledger.hpp"
#include "test_persistence.hpp"
#include "test_store.hpp"
#include "test_telemetry.hpp"

int main() {
  using namespace ledgercore::tests;

  // Money arithmetic
  test_amount_parse_and_format();
  test_amount_rounding();

  // Store tests
  test_unit_of_work_isolation();
  test_commit_integrity();
  test_commit_guards();
  test_change_set_codec();

  // Catalog tests
  test_account_catalog();
  test_period_registry();
  test_product_restrict_delete();
  test_client_registry();

  // Ledger tests
  test_entry_exclusivity();
  test_entry_references();
  test_entry_update_and_remove();
  test_balance_query();
  test_transaction_lifecycle();
  test_transaction_deletion_policy();
  test_journal_order();
  test_general_ledger();

  // Invoice tests
  test_line_aggregator();
  test_line_aggregator_validation();
  test_invoice_totals_follow_lines();
  test_invoice_cascade_delete();
  test_invoice_header();
  test_invoice_numbering();
  test_invoice_line_rejections();
  test_invoice_statistics();
  test_invoice_totals_overflow();

  // Concurrency tests
  test_concurrent_lines_locking();
  test_concurrent_lines_optimistic();
  test_optimistic_conflict_reported();
  test_optimistic_entry_conflict();
  test_concurrent_entries();

  // Identity, config and telemetry tests
  test_token_generator();
  test_config_defaults();
  test_config_overrides();
  test_config_validation();
  test_telemetry_sink();
  test_scoped_latency();

  // Persistence/replay tests
  test_journal_records();
  test_journal_corruption();
  test_persistence_replay();

  return 0;
}
