#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "ledgercore/common/types.hpp"

namespace ledgercore {
namespace config {

struct LedgerSection {
  std::string default_currency{"USD"};
  common::DeletionPolicy transaction_delete_policy{common::DeletionPolicy::kReject};
};

struct InvoicingSection {
  std::int32_t tax_rate_basis_points{1300};
  std::string number_prefix{"FACT"};
  std::string cash_terms{"Contado"};
  std::int32_t credit_days{30};
};

struct ConcurrencySection {
  common::ConcurrencyMode mode{common::ConcurrencyMode::kLocking};
};

struct PersistenceConfig {
  bool enabled{false};
  std::filesystem::path journal_path{"/var/lib/ledgercore/commits.journal"};
  std::size_t journal_flush_threshold{4096};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct LedgerConfig {
  LedgerSection ledger;
  InvoicingSection invoicing;
  ConcurrencySection concurrency;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  LedgerConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const LedgerConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace ledgercore
