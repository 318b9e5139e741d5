#pragma once

#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"
#include "ledgercore/store/unit_of_work.hpp"

namespace ledgercore {
namespace telemetry {
class TelemetrySink;
}  // namespace telemetry

namespace invoice {

// Sole writer of the invoice aggregate fields. Totals are re-derived from
// the lines attached to the invoice at the moment of recomputation; the
// header discount is left untouched.
class TotalMaintainer {
 public:
  explicit TotalMaintainer(store::Store& store, telemetry::TelemetrySink* sink = nullptr) noexcept
      : store_(store), telemetry_(sink) {}

  // Recomputes inside an open unit of work that has already serialized on
  // the invoice. Reads see the unit's own staged line changes, and the
  // updated header is staged for the same commit.
  [[nodiscard]] common::Result<store::InvoiceTotals> recompute_within(store::UnitOfWork& uow,
                                                                      const common::InvoiceId& id) const;

  // Standalone recomputation in its own unit of work.
  common::Result<store::InvoiceTotals> recompute_invoice_totals(const common::InvoiceId& id);

 private:
  store::Store& store_;
  telemetry::TelemetrySink* telemetry_;
};

}  // namespace invoice
}  // namespace ledgercore
