#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ledgercore/common/amount.hpp"
#include "ledgercore/common/paging.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/identity/token_generator.hpp"
#include "ledgercore/invoice/line_aggregator.hpp"
#include "ledgercore/invoice/total_maintainer.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace telemetry {
class TelemetrySink;
}  // namespace telemetry

namespace invoice {

struct InvoiceOptions {
  std::int32_t tax_rate_basis_points{LineAggregator::kDefaultTaxRateBasisPoints};
  std::string number_prefix{"FACT"};
  std::string cash_terms{"Contado"};
  std::int32_t credit_days{30};
};

struct InvoiceDraft {
  std::optional<std::string> number;  // <prefix>-<YYYY>-<NNNN> when absent
  std::optional<common::ClientId> client;
  std::optional<common::TransactionId> transaction;
  common::Date issue_date{};
  std::optional<common::Date> due_date;  // issue date + credit days unless cash terms
  std::string payment_terms;
  std::string salesperson;
  std::string notes;
  common::Amount discount{};
};

// Header fields a caller may change after creation. Number, issue date and
// aggregate totals are not among them.
struct InvoiceHeader {
  std::optional<common::ClientId> client;
  std::optional<common::Date> due_date;
  std::string payment_terms;
  std::string salesperson;
  std::string notes;
  common::Amount discount{};
};

struct LineDraft {
  common::ProductId product{0};
  common::Amount quantity{};
  std::optional<common::Amount> unit_price;  // product price when absent
  std::optional<common::Amount> discount_percentage;
  std::optional<common::Amount> discount_amount;
};

struct InvoiceFilter {
  std::optional<common::ClientId> client;
  std::optional<common::Date> from;
  std::optional<common::Date> to;
  common::Page page{};
};

struct InvoiceStatistics {
  std::size_t count{0};
  common::Amount grand_total{};
  common::Amount subtotal{};
  common::Amount tax{};
  common::Amount discount{};
  common::Amount average_grand_total{};
};

// Invoice headers and lines. Every line mutation and the recomputation of
// the owning invoice's totals commit as one unit of work, serialized on the
// invoice.
class InvoiceService {
 public:
  InvoiceService(store::Store& store, const identity::TokenGenerator& tokens, InvoiceOptions options = {},
                 telemetry::TelemetrySink* sink = nullptr);

  common::Result<store::InvoiceRow> create(const InvoiceDraft& draft);
  common::Result<store::InvoiceRow> update_header(const common::InvoiceId& id, const InvoiceHeader& header);
  // Removes the header and all of its lines.
  common::Status delete_invoice(const common::InvoiceId& id);

  [[nodiscard]] common::Result<store::InvoiceRow> get(const common::InvoiceId& id) const;
  [[nodiscard]] common::Result<store::InvoiceRow> find_by_number(const std::string& number) const;
  // Newest issue date first.
  [[nodiscard]] std::vector<store::InvoiceRow> list(const InvoiceFilter& filter = {}) const;

  common::Result<store::InvoiceLineRow> add_line(const common::InvoiceId& id, const LineDraft& draft);
  common::Result<store::InvoiceLineRow> update_line(common::LineId id, const LineDraft& draft);
  common::Status remove_line(common::LineId id);
  [[nodiscard]] std::vector<store::InvoiceLineRow> lines(const common::InvoiceId& id) const;

  [[nodiscard]] common::Result<InvoiceStatistics> statistics(std::optional<common::Date> from = std::nullopt,
                                                             std::optional<common::Date> to = std::nullopt) const;

  [[nodiscard]] const InvoiceOptions& options() const noexcept { return options_; }
  [[nodiscard]] const LineAggregator& aggregator() const noexcept { return aggregator_; }
  [[nodiscard]] TotalMaintainer& maintainer() noexcept { return maintainer_; }

 private:
  template <typename T>
  common::Result<T> count_line(common::Result<T> result) const;

  store::Store& store_;
  const identity::TokenGenerator& tokens_;
  InvoiceOptions options_;
  LineAggregator aggregator_;
  TotalMaintainer maintainer_;
  telemetry::TelemetrySink* telemetry_;
};

}  // namespace invoice
}  // namespace ledgercore
