#include "ledgercore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <cctype>
#include <sstream>

namespace ledgercore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

// Enum-valued keys are parsed after the fact so that a bad value becomes a
// validation error instead of silently falling back to the default.
struct RawEnums {
  std::string delete_policy;
  std::string concurrency_mode;
};

LedgerSection parse_ledger(const toml::table& root, RawEnums& raw) {
  LedgerSection cfg;
  raw.delete_policy = std::string(common::to_string(cfg.transaction_delete_policy));
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.default_currency = get_str_or(*ledger, "default_currency", cfg.default_currency);
    raw.delete_policy = get_str_or(*ledger, "transaction_delete_policy", raw.delete_policy);
  }
  if (auto policy = common::parse_deletion_policy(raw.delete_policy)) {
    cfg.transaction_delete_policy = *policy;
  }
  return cfg;
}

InvoicingSection parse_invoicing(const toml::table& root) {
  InvoicingSection cfg;
  if (auto* invoicing = root["invoicing"].as_table()) {
    cfg.tax_rate_basis_points = static_cast<std::int32_t>(get_int_or(*invoicing, "tax_rate_bp", cfg.tax_rate_basis_points));
    cfg.number_prefix = get_str_or(*invoicing, "number_prefix", cfg.number_prefix);
    cfg.cash_terms = get_str_or(*invoicing, "cash_terms", cfg.cash_terms);
    cfg.credit_days = static_cast<std::int32_t>(get_int_or(*invoicing, "credit_days", cfg.credit_days));
  }
  return cfg;
}

ConcurrencySection parse_concurrency(const toml::table& root, RawEnums& raw) {
  ConcurrencySection cfg;
  raw.concurrency_mode = std::string(common::to_string(cfg.mode));
  if (auto* concurrency = root["concurrency"].as_table()) {
    raw.concurrency_mode = get_str_or(*concurrency, "mode", raw.concurrency_mode);
  }
  if (auto mode = common::parse_concurrency_mode(raw.concurrency_mode)) {
    cfg.mode = *mode;
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.enabled = get_bool_or(*persistence, "enabled", cfg.enabled);
    cfg.journal_path = get_str_or(*persistence, "journal_path", cfg.journal_path.string());
    cfg.journal_flush_threshold = static_cast<std::size_t>(get_int_or(*persistence, "journal_flush_threshold", static_cast<std::int64_t>(cfg.journal_flush_threshold)));
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

LedgerConfig parse_config(const toml::table& root, RawEnums& raw) {
  LedgerConfig cfg;
  cfg.ledger = parse_ledger(root, raw);
  cfg.invoicing = parse_invoicing(root);
  cfg.concurrency = parse_concurrency(root, raw);
  cfg.persistence = parse_persistence(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

void validate_enums(const RawEnums& raw, std::vector<ValidationError>& errors) {
  if (!common::parse_deletion_policy(raw.delete_policy)) {
    errors.push_back({"ledger.transaction_delete_policy", "must be \"reject\" or \"cascade\", got \"" + raw.delete_policy + "\""});
  }
  if (!common::parse_concurrency_mode(raw.concurrency_mode)) {
    errors.push_back({"concurrency.mode", "must be \"locking\" or \"optimistic\", got \"" + raw.concurrency_mode + "\""});
  }
}

LoadResult finish(const toml::table& root) {
  LoadResult result;
  RawEnums raw;
  result.config = parse_config(root, raw);
  result.errors = ConfigLoader::validate(result.config);
  validate_enums(raw, result.errors);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    LoadResult result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    LoadResult result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const LedgerConfig& config) {
  std::vector<ValidationError> errors;

  const auto& currency = config.ledger.default_currency;
  if (currency.size() != 3 || !std::isupper(static_cast<unsigned char>(currency[0])) ||
      !std::isupper(static_cast<unsigned char>(currency[1])) || !std::isupper(static_cast<unsigned char>(currency[2]))) {
    errors.push_back({"ledger.default_currency", "must be a three letter upper-case currency code"});
  }

  if (config.invoicing.tax_rate_basis_points < 0 || config.invoicing.tax_rate_basis_points > 10'000) {
    errors.push_back({"invoicing.tax_rate_bp", "must be between 0 and 10000"});
  }

  if (config.invoicing.number_prefix.empty()) {
    errors.push_back({"invoicing.number_prefix", "number_prefix cannot be empty"});
  }

  if (config.invoicing.credit_days < 0) {
    errors.push_back({"invoicing.credit_days", "must not be negative"});
  }

  if (config.persistence.enabled && config.persistence.journal_path.empty()) {
    errors.push_back({"persistence.journal_path", "journal_path cannot be empty when persistence is enabled"});
  }

  if (config.persistence.journal_flush_threshold == 0) {
    errors.push_back({"persistence.journal_flush_threshold", "must be greater than 0"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# ledgercore configuration
# Generated default configuration

[ledger]
default_currency = "USD"
transaction_delete_policy = "reject"   # or "cascade"

[invoicing]
tax_rate_bp = 1300        # 13%
number_prefix = "FACT"
cash_terms = "Contado"
credit_days = 30

[concurrency]
mode = "locking"          # or "optimistic"

[persistence]
enabled = false
journal_path = "/var/lib/ledgercore/commits.journal"
journal_flush_threshold = 4096

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace ledgercore
