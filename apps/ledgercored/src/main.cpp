#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <vector>

#include "ledgercore/catalog/account_catalog.hpp"
#include "ledgercore/catalog/client_registry.hpp"
#include "ledgercore/catalog/period_registry.hpp"
#include "ledgercore/catalog/product_catalog.hpp"
#include "ledgercore/config/config_loader.hpp"
#include "ledgercore/identity/token_generator.hpp"
#include "ledgercore/invoice/invoice_service.hpp"
#include "ledgercore/ledger/balance_query.hpp"
#include "ledgercore/ledger/ledger_book.hpp"
#include "ledgercore/replay/replay_driver.hpp"
#include "ledgercore/store/store.hpp"
#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"
#include "ledgercore/wal/wal_writer.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./ledgercore.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./ledgercore.toml",
      "/etc/ledgercore/ledgercore.toml",
      home ? std::filesystem::path{home} / ".config/ledgercore/ledgercore.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool report_errors(const ledgercore::config::LoadResult& result) {
  if (result.success) {
    return false;
  }
  if (!result.raw_error.empty()) {
    std::cerr << "Parse error: " << result.raw_error << "\n";
  }
  for (const auto& err : result.errors) {
    std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
  }
  return true;
}

void print_ledger(const ledgercore::store::Store& store) {
  using namespace ledgercore;

  const auto transactions = store.read([](const store::Tables& tables) {
    std::vector<common::TransactionId> ids;
    tables.transactions.for_each([&](const store::TransactionRow& row) { ids.push_back(row.id); });
    return ids;
  });

  ledger::BalanceQuery balances{store};
  std::size_t unbalanced = 0;
  for (auto id : transactions) {
    auto balance = balances.compute_balance(id);
    if (!balance.ok()) {
      continue;
    }
    const auto& value = *balance.value;
    std::cout << "  Transaction " << id << ": debit " << value.total_debit.to_string() << " credit "
              << value.total_credit.to_string() << (value.is_balanced ? " balanced" : " unbalanced") << "\n";
    if (!value.is_balanced) {
      ++unbalanced;
    }
  }
  std::cout << "Transactions: " << transactions.size() << " (" << unbalanced << " unbalanced)\n";

  ledger::LedgerBook book{store};
  auto general = book.general_ledger({.digits = 1});
  if (!general.ok()) {
    std::cerr << "General ledger failed: " << general.status.message << "\n";
    return;
  }
  std::cout << "General ledger (1 digit):\n";
  for (const auto& major : general.value->majors) {
    std::cout << "  " << major.code << " " << major.name << ": debit " << major.debit.to_string() << " credit "
              << major.credit.to_string() << " balance " << major.balance.to_string() << "\n";
  }
  const auto& summary = general.value->summary;
  std::cout << "  Total debit " << summary.total_debit.to_string() << ", total credit "
            << summary.total_credit.to_string() << ", difference " << summary.difference.to_string() << "\n";
}

void print_telemetry(ledgercore::telemetry::TelemetrySink& sink) {
  using namespace ledgercore;

  std::cout << "Telemetry:\n";
  for (const auto& [id, total] : sink.drain_counters()) {
    std::cout << "  " << telemetry::metrics::name_of(id) << ": " << total << "\n";
  }
  for (const auto& summary : sink.drain_latency()) {
    std::cout << "  " << telemetry::metrics::name_of(summary.id) << ": " << summary.count << " samples, mean "
              << summary.mean_ns << "ns, p99 " << summary.p99_ns << "ns\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace ledgercore;

  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::LedgerConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (report_errors(result)) {
      std::cerr << "Failed to load default config\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (report_errors(result)) {
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Currency: " << cfg.ledger.default_currency << "\n";
  std::cout << "  Transaction delete policy: " << common::to_string(cfg.ledger.transaction_delete_policy) << "\n";
  std::cout << "  Tax rate: " << cfg.invoicing.tax_rate_basis_points << " bp\n";
  std::cout << "  Concurrency: " << common::to_string(cfg.concurrency.mode) << "\n";

  telemetry::TelemetrySink sink;
  telemetry::TelemetrySink* metrics_sink = cfg.telemetry.enabled ? &sink : nullptr;

  store::Store store{cfg.concurrency.mode};
  store.set_telemetry(metrics_sink);

  std::unique_ptr<wal::Writer> journal;
  if (cfg.persistence.enabled) {
    std::cout << "  Journal: " << cfg.persistence.journal_path << "\n";
    try {
      replay::Driver driver;
      driver.configure(cfg.persistence.journal_path);
      const auto replayed = driver.rebuild(store, metrics_sink);
      std::cout << "Replayed " << replayed << " journal records\n";

      if (cfg.persistence.journal_path.has_parent_path()) {
        std::filesystem::create_directories(cfg.persistence.journal_path.parent_path());
      }
      journal = std::make_unique<wal::Writer>(cfg.persistence.journal_path, cfg.persistence.journal_flush_threshold);
      replay::attach_writer(store, *journal, metrics_sink);
    } catch (const std::exception& ex) {
      std::cerr << "Journal recovery failed: " << ex.what() << "\n";
      return 1;
    }
  }

  identity::TokenGenerator tokens;
  catalog::AccountCatalog accounts{store};
  catalog::PeriodRegistry periods{store};
  catalog::ProductCatalog products{store};
  catalog::ClientRegistry clients{store};
  invoice::InvoiceService invoices{store, tokens,
                                   {
                                       .tax_rate_basis_points = cfg.invoicing.tax_rate_basis_points,
                                       .number_prefix = cfg.invoicing.number_prefix,
                                       .cash_terms = cfg.invoicing.cash_terms,
                                       .credit_days = cfg.invoicing.credit_days,
                                   },
                                   metrics_sink};

  std::cout << "ledgercored bootstrapped successfully\n";
  constexpr common::Page kEverything{.offset = 0, .limit = std::numeric_limits<std::size_t>::max()};
  std::cout << "Accounts: " << accounts.list(kEverything).size() << ", periods: " << periods.list(kEverything).size()
            << ", products: " << products.list(false, kEverything).size()
            << ", clients: " << clients.list(false, kEverything).size() << "\n";

  print_ledger(store);

  auto stats = invoices.statistics();
  if (stats.ok()) {
    const auto& value = *stats.value;
    std::cout << "Invoices: " << value.count << ", subtotal " << value.subtotal.to_string() << ", tax "
              << value.tax.to_string() << ", grand total " << value.grand_total.to_string() << ", average "
              << value.average_grand_total.to_string() << "\n";
  }

  if (metrics_sink) {
    print_telemetry(sink);
  }

  if (journal) {
    try {
      journal->sync();
    } catch (const std::exception& ex) {
      std::cerr << "Journal sync failed: " << ex.what() << "\n";
      return 1;
    }
  }
  return 0;
}
