#include "ledgercore/invoice/total_maintainer.hpp"

#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"

namespace ledgercore {
namespace invoice {

namespace {
constexpr std::uint16_t kRejectCodeUnknownInvoice = 3401;
constexpr std::uint16_t kRejectCodeTotalsOverflow = 3402;

using TotalsResult = common::Result<store::InvoiceTotals>;

}  // namespace

TotalsResult TotalMaintainer::recompute_within(store::UnitOfWork& uow, const common::InvoiceId& id) const {
  telemetry::ScopedLatency latency(telemetry_, telemetry::metrics::kTotalsRecomputeLatency);

  auto invoice = uow.get<store::InvoiceRow>(id);
  if (!invoice) {
    return TotalsResult::failure(
        common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownInvoice, "invoice " + id + " does not exist"));
  }

  common::Amount subtotal{};
  common::Amount tax{};
  common::Amount grand_total{};
  const auto lines =
      uow.select<store::InvoiceLineRow>([&id](const store::InvoiceLineRow& line) { return line.invoice == id; });
  for (const auto& line : lines) {
    const auto next_subtotal = common::checked_add(subtotal, line.subtotal);
    const auto next_tax = common::checked_add(tax, line.tax);
    const auto next_total = common::checked_add(grand_total, line.total);
    if (!next_subtotal || !next_tax || !next_total) {
      return TotalsResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeTotalsOverflow,
                                                  "totals of invoice " + id + " exceed the representable range"));
    }
    subtotal = *next_subtotal;
    tax = *next_tax;
    grand_total = *next_total;
  }

  invoice->totals.assign(store::TotalsKey{}, subtotal, tax, grand_total);
  auto totals = invoice->totals;
  uow.put(std::move(*invoice));

  if (telemetry_) {
    telemetry_->increment(telemetry::metrics::kTotalsRecomputed);
  }
  return TotalsResult::success(totals);
}

TotalsResult TotalMaintainer::recompute_invoice_totals(const common::InvoiceId& id) {
  store::UnitOfWork uow(store_);
  uow.serialize_on<store::InvoiceRow>(id);
  auto result = recompute_within(uow, id);
  if (!result.ok()) {
    return result;
  }
  if (auto status = uow.commit(); !status.ok()) {
    return TotalsResult::failure(std::move(status));
  }
  return result;
}

}  // namespace invoice
}  // namespace ledgercore
