#include "test_config.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "ledgercore/config/config_loader.hpp"

namespace ledgercore::tests {

namespace {

bool has_error(const config::LoadResult& result, const std::string& field) {
  return std::any_of(result.errors.begin(), result.errors.end(),
                     [&](const config::ValidationError& err) { return err.field == field; });
}

}  // namespace

void test_config_defaults() {
  auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.success);
  assert(result.errors.empty());
  assert(result.config.ledger.default_currency == "USD");
  assert(result.config.ledger.transaction_delete_policy == common::DeletionPolicy::kReject);
  assert(result.config.invoicing.tax_rate_basis_points == 1'300);
  assert(result.config.invoicing.number_prefix == "FACT");
  assert(result.config.invoicing.cash_terms == "Contado");
  assert(result.config.invoicing.credit_days == 30);
  assert(result.config.concurrency.mode == common::ConcurrencyMode::kLocking);
  assert(!result.config.persistence.enabled);
  assert(result.config.telemetry.enabled);

  // Missing sections fall back to the same defaults.
  auto empty = config::ConfigLoader::load_from_string("");
  assert(empty.success);
  assert(empty.config.invoicing.tax_rate_basis_points == 1'300);

  auto missing = config::ConfigLoader::load("/nonexistent/ledgercore.toml");
  assert(!missing.success);
  assert(!missing.raw_error.empty());
}

void test_config_overrides() {
  const auto path = std::filesystem::temp_directory_path() / "ledgercore_config_test.toml";
  {
    std::ofstream out(path);
    out << "[ledger]\n"
        << "default_currency = \"CRC\"\n"
        << "transaction_delete_policy = \"cascade\"\n"
        << "[invoicing]\n"
        << "tax_rate_bp = 1000\n"
        << "number_prefix = \"INV\"\n"
        << "credit_days = 45\n"
        << "[concurrency]\n"
        << "mode = \"optimistic\"\n"
        << "[persistence]\n"
        << "enabled = true\n"
        << "journal_path = \"/tmp/ledgercore/commits.journal\"\n"
        << "journal_flush_threshold = 128\n"
        << "[telemetry]\n"
        << "enabled = false\n";
  }

  auto result = config::ConfigLoader::load(path);
  assert(result.success);
  assert(result.config.ledger.default_currency == "CRC");
  assert(result.config.ledger.transaction_delete_policy == common::DeletionPolicy::kCascade);
  assert(result.config.invoicing.tax_rate_basis_points == 1'000);
  assert(result.config.invoicing.number_prefix == "INV");
  assert(result.config.invoicing.cash_terms == "Contado");
  assert(result.config.invoicing.credit_days == 45);
  assert(result.config.concurrency.mode == common::ConcurrencyMode::kOptimistic);
  assert(result.config.persistence.enabled);
  assert(result.config.persistence.journal_path == "/tmp/ledgercore/commits.journal");
  assert(result.config.persistence.journal_flush_threshold == 128);
  assert(!result.config.telemetry.enabled);

  std::filesystem::remove(path);
}

void test_config_validation() {
  auto parse_error = config::ConfigLoader::load_from_string("[ledger\ndefault_currency = ");
  assert(!parse_error.success);
  assert(!parse_error.raw_error.empty());

  // Every offending field is reported, not just the first.
  auto result = config::ConfigLoader::load_from_string(
      "[ledger]\n"
      "default_currency = \"usd\"\n"
      "transaction_delete_policy = \"archive\"\n"
      "[invoicing]\n"
      "tax_rate_bp = 12000\n"
      "number_prefix = \"\"\n"
      "credit_days = -1\n"
      "[concurrency]\n"
      "mode = \"eventual\"\n"
      "[persistence]\n"
      "enabled = true\n"
      "journal_path = \"\"\n"
      "journal_flush_threshold = 0\n");
  assert(!result.success);
  assert(has_error(result, "ledger.default_currency"));
  assert(has_error(result, "ledger.transaction_delete_policy"));
  assert(has_error(result, "invoicing.tax_rate_bp"));
  assert(has_error(result, "invoicing.number_prefix"));
  assert(has_error(result, "invoicing.credit_days"));
  assert(has_error(result, "concurrency.mode"));
  assert(has_error(result, "persistence.journal_path"));
  assert(has_error(result, "persistence.journal_flush_threshold"));
  assert(result.errors.size() == 8);
}

}  // namespace ledgercore::tests
