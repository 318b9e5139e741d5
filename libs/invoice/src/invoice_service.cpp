#include "ledgercore/invoice/invoice_service.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <tuple>
#include <utility>

#include "ledgercore/common/time_utils.hpp"
#include "ledgercore/store/unit_of_work.hpp"
#include "ledgercore/telemetry/metric_ids.hpp"
#include "ledgercore/telemetry/telemetry_sink.hpp"

namespace ledgercore {
namespace invoice {

namespace {
constexpr std::uint16_t kRejectCodeUnknownInvoice = 3001;
constexpr std::uint16_t kRejectCodeUnknownClient = 3002;
constexpr std::uint16_t kRejectCodeInactiveClient = 3003;
constexpr std::uint16_t kRejectCodeUnknownTransaction = 3004;
constexpr std::uint16_t kRejectCodeDuplicateNumber = 3005;
constexpr std::uint16_t kRejectCodeNumberConflict = 3006;
constexpr std::uint16_t kRejectCodeInvalidHeader = 3007;
constexpr std::uint16_t kRejectCodeUnknownProduct = 3201;
constexpr std::uint16_t kRejectCodeInactiveProduct = 3202;
constexpr std::uint16_t kRejectCodeUnknownLine = 3203;
constexpr std::uint16_t kRejectCodeInvalidRange = 3301;
constexpr std::uint16_t kRejectCodeStatisticsOverflow = 3302;

constexpr int kNumberDigits = 4;

using InvoiceResult = common::Result<store::InvoiceRow>;
using LineResult = common::Result<store::InvoiceLineRow>;

common::Status unknown_invoice(const common::InvoiceId& id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownInvoice, "invoice " + id + " does not exist");
}

common::Status unknown_line(common::LineId id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownLine,
                        "invoice line " + std::to_string(id) + " does not exist");
}

common::Status check_client(const store::UnitOfWork& uow, const std::optional<common::ClientId>& id) {
  if (!id) {
    return common::ok_status();
  }
  auto client = uow.get<store::ClientRow>(*id);
  if (!client) {
    return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownClient,
                          "client " + std::to_string(*id) + " does not exist");
  }
  if (!client->active) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInactiveClient,
                          "client " + client->name + " is inactive");
  }
  return common::ok_status();
}

common::Status check_header(common::Date issue_date, const std::optional<common::Date>& due_date,
                            common::Amount discount) {
  if (discount.is_negative()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidHeader,
                          "invoice discount must not be negative");
  }
  if (due_date && *due_date < issue_date) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidHeader,
                          "due date must not be before the issue date");
  }
  return common::ok_status();
}

std::string number_stem(const std::string& prefix, int year) {
  return prefix + "-" + std::to_string(year) + "-";
}

// Highest sequence already used under stem, 0 when none.
std::uint32_t last_sequence(const std::vector<store::InvoiceRow>& invoices, const std::string& stem) {
  std::uint32_t last = 0;
  for (const auto& invoice : invoices) {
    if (invoice.number.size() <= stem.size() || invoice.number.compare(0, stem.size(), stem) != 0) {
      continue;
    }
    const char* first = invoice.number.data() + stem.size();
    const char* end = invoice.number.data() + invoice.number.size();
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(first, end, value);
    if (ec == std::errc{} && ptr == end) {
      last = std::max(last, value);
    }
  }
  return last;
}

std::string format_number(const std::string& stem, std::uint32_t sequence) {
  std::ostringstream oss;
  oss << stem << std::setw(kNumberDigits) << std::setfill('0') << sequence;
  return oss.str();
}

common::Amount average(common::Amount total, std::size_t count) {
  if (count == 0) {
    return {};
  }
  const auto divisor = static_cast<std::int64_t>(count);
  auto quotient = total.cents() / divisor;
  const auto remainder = total.cents() % divisor;
  if (remainder * 2 >= divisor) {
    ++quotient;
  } else if (remainder * 2 <= -divisor) {
    --quotient;
  }
  return common::Amount::from_cents(quotient);
}

}  // namespace

InvoiceService::InvoiceService(store::Store& store, const identity::TokenGenerator& tokens, InvoiceOptions options,
                               telemetry::TelemetrySink* sink)
    : store_(store),
      tokens_(tokens),
      options_(std::move(options)),
      aggregator_(options_.tax_rate_basis_points),
      maintainer_(store, sink),
      telemetry_(sink) {}

template <typename T>
common::Result<T> InvoiceService::count_line(common::Result<T> result) const {
  if (telemetry_) {
    telemetry_->increment(result.ok() ? telemetry::metrics::kLineMutations : telemetry::metrics::kLinesRejected);
  }
  return result;
}

InvoiceResult InvoiceService::create(const InvoiceDraft& draft) {
  if (draft.number && draft.number->empty()) {
    return InvoiceResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidHeader,
                                                 "invoice number must not be empty when given"));
  }
  if (auto status = check_header(draft.issue_date, draft.due_date, draft.discount); !status.ok()) {
    return InvoiceResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  if (auto status = check_client(uow, draft.client); !status.ok()) {
    return InvoiceResult::failure(std::move(status));
  }
  if (draft.transaction && !uow.contains<store::TransactionRow>(*draft.transaction)) {
    return InvoiceResult::failure(common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownTransaction,
                                                 "transaction " + std::to_string(*draft.transaction) +
                                                     " does not exist"));
  }

  store::InvoiceRow row;
  row.id = tokens_.next();
  if (draft.number) {
    const bool taken = !uow.select<store::InvoiceRow>([&](const store::InvoiceRow& invoice) {
                          return invoice.number == *draft.number;
                        }).empty();
    if (taken) {
      return InvoiceResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeDuplicateNumber,
                                                   "invoice number " + *draft.number + " already exists"));
    }
    row.number = *draft.number;
  } else {
    const auto stem = number_stem(options_.number_prefix, common::year_of(draft.issue_date));
    const auto same_year = uow.select<store::InvoiceRow>(
        [&stem](const store::InvoiceRow& invoice) { return invoice.number.starts_with(stem); });
    row.number = format_number(stem, last_sequence(same_year, stem) + 1);
  }

  row.client = draft.client;
  row.transaction = draft.transaction;
  row.issue_date = draft.issue_date;
  row.due_date = draft.due_date;
  if (!row.due_date && draft.payment_terms != options_.cash_terms) {
    row.due_date = common::add_days(draft.issue_date, options_.credit_days);
  }
  row.payment_terms = draft.payment_terms;
  row.salesperson = draft.salesperson;
  row.notes = draft.notes;
  row.discount = draft.discount;
  uow.put(row);

  auto status = uow.commit();
  if (!status.ok()) {
    if (!draft.number && status.reject_code == store::codes::kDuplicateInvoiceNumber) {
      return InvoiceResult::failure(common::reject(common::ErrorKind::kConcurrencyConflict, kRejectCodeNumberConflict,
                                                   "invoice number " + row.number +
                                                       " was taken concurrently, retry the operation"));
    }
    return InvoiceResult::failure(std::move(status));
  }
  if (telemetry_) {
    telemetry_->increment(telemetry::metrics::kInvoicesCreated);
  }
  return InvoiceResult::success(std::move(row));
}

InvoiceResult InvoiceService::update_header(const common::InvoiceId& id, const InvoiceHeader& header) {
  store::UnitOfWork uow(store_);
  uow.serialize_on<store::InvoiceRow>(id);
  auto row = uow.get<store::InvoiceRow>(id);
  if (!row) {
    return InvoiceResult::failure(unknown_invoice(id));
  }
  if (auto status = check_header(row->issue_date, header.due_date, header.discount); !status.ok()) {
    return InvoiceResult::failure(std::move(status));
  }
  if (header.client != row->client) {
    if (auto status = check_client(uow, header.client); !status.ok()) {
      return InvoiceResult::failure(std::move(status));
    }
  }

  row->client = header.client;
  row->due_date = header.due_date;
  if (!row->due_date && header.payment_terms != options_.cash_terms) {
    row->due_date = common::add_days(row->issue_date, options_.credit_days);
  }
  row->payment_terms = header.payment_terms;
  row->salesperson = header.salesperson;
  row->notes = header.notes;
  row->discount = header.discount;
  uow.put(*row);
  if (auto status = uow.commit(); !status.ok()) {
    return InvoiceResult::failure(std::move(status));
  }
  return InvoiceResult::success(std::move(*row));
}

common::Status InvoiceService::delete_invoice(const common::InvoiceId& id) {
  store::UnitOfWork uow(store_);
  uow.serialize_on<store::InvoiceRow>(id);
  if (!uow.contains<store::InvoiceRow>(id)) {
    return unknown_invoice(id);
  }
  const auto lines =
      uow.select<store::InvoiceLineRow>([&id](const store::InvoiceLineRow& line) { return line.invoice == id; });
  for (const auto& line : lines) {
    uow.erase<store::InvoiceLineRow>(line.id);
  }
  uow.erase<store::InvoiceRow>(id);
  return uow.commit();
}

InvoiceResult InvoiceService::get(const common::InvoiceId& id) const {
  return store_.read([&](const store::Tables& tables) {
    if (const auto* row = tables.invoices.find(id)) {
      return InvoiceResult::success(*row);
    }
    return InvoiceResult::failure(unknown_invoice(id));
  });
}

InvoiceResult InvoiceService::find_by_number(const std::string& number) const {
  return store_.read([&](const store::Tables& tables) {
    std::optional<store::InvoiceRow> found;
    tables.invoices.for_each([&](const store::InvoiceRow& row) {
      if (row.number == number) {
        found = row;
      }
    });
    if (found) {
      return InvoiceResult::success(std::move(*found));
    }
    return InvoiceResult::failure(common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownInvoice,
                                                 "invoice number " + number + " does not exist"));
  });
}

std::vector<store::InvoiceRow> InvoiceService::list(const InvoiceFilter& filter) const {
  auto rows = store_.read([&](const store::Tables& tables) {
    std::vector<store::InvoiceRow> out;
    tables.invoices.for_each([&](const store::InvoiceRow& row) {
      if (filter.client && row.client != filter.client) {
        return;
      }
      if ((filter.from && row.issue_date < *filter.from) || (filter.to && row.issue_date > *filter.to)) {
        return;
      }
      out.push_back(row);
    });
    return out;
  });
  std::sort(rows.begin(), rows.end(), [](const store::InvoiceRow& lhs, const store::InvoiceRow& rhs) {
    return std::tie(rhs.issue_date, rhs.number) < std::tie(lhs.issue_date, lhs.number);
  });
  return common::slice(std::move(rows), filter.page);
}

LineResult InvoiceService::add_line(const common::InvoiceId& id, const LineDraft& draft) {
  store::UnitOfWork uow(store_);
  uow.serialize_on<store::InvoiceRow>(id);
  if (!uow.contains<store::InvoiceRow>(id)) {
    return count_line(LineResult::failure(unknown_invoice(id)));
  }

  auto product = uow.get<store::ProductRow>(draft.product);
  if (!product) {
    return count_line(LineResult::failure(common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownProduct,
                                                         "product " + std::to_string(draft.product) +
                                                             " does not exist")));
  }
  if (!product->active) {
    return count_line(LineResult::failure(common::reject(common::ErrorKind::kConstraintViolation,
                                                         kRejectCodeInactiveProduct,
                                                         "product " + product->name + " is inactive")));
  }

  const auto unit_price = draft.unit_price.value_or(product->unit_price);
  auto aggregate = aggregator_.compute_line(LineInput{
      .quantity = draft.quantity,
      .unit_price = unit_price,
      .discount_percentage = draft.discount_percentage,
      .discount_amount = draft.discount_amount,
      .taxable = product->taxable,
  });
  if (!aggregate.ok()) {
    return count_line(LineResult::failure(std::move(aggregate.status)));
  }

  store::InvoiceLineRow line{
      .id = uow.next_id<store::InvoiceLineRow>(),
      .invoice = id,
      .product = draft.product,
      .quantity = draft.quantity,
      .unit_price = unit_price,
      .discount_percentage = draft.discount_percentage.value_or(common::Amount{}),
      .discount_amount = aggregate.value->discount_amount,
      .subtotal = aggregate.value->subtotal,
      .tax = aggregate.value->tax,
      .total = aggregate.value->total,
  };
  uow.put(line);

  if (auto totals = maintainer_.recompute_within(uow, id); !totals.ok()) {
    return count_line(LineResult::failure(std::move(totals.status)));
  }
  if (auto status = uow.commit(); !status.ok()) {
    return count_line(LineResult::failure(std::move(status)));
  }
  return count_line(LineResult::success(std::move(line)));
}

LineResult InvoiceService::update_line(common::LineId id, const LineDraft& draft) {
  store::UnitOfWork uow(store_);
  auto line = uow.get<store::InvoiceLineRow>(id);
  if (!line) {
    return count_line(LineResult::failure(unknown_line(id)));
  }
  const auto invoice = line->invoice;
  uow.serialize_on<store::InvoiceRow>(invoice);
  line = uow.get<store::InvoiceLineRow>(id);
  if (!line || line->invoice != invoice) {
    return count_line(LineResult::failure(unknown_line(id)));
  }

  auto product = uow.get<store::ProductRow>(draft.product);
  if (!product) {
    return count_line(LineResult::failure(common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownProduct,
                                                         "product " + std::to_string(draft.product) +
                                                             " does not exist")));
  }
  if (!product->active) {
    return count_line(LineResult::failure(common::reject(common::ErrorKind::kConstraintViolation,
                                                         kRejectCodeInactiveProduct,
                                                         "product " + product->name + " is inactive")));
  }

  const auto unit_price = draft.unit_price.value_or(product->unit_price);
  auto aggregate = aggregator_.compute_line(LineInput{
      .quantity = draft.quantity,
      .unit_price = unit_price,
      .discount_percentage = draft.discount_percentage,
      .discount_amount = draft.discount_amount,
      .taxable = product->taxable,
  });
  if (!aggregate.ok()) {
    return count_line(LineResult::failure(std::move(aggregate.status)));
  }

  line->product = draft.product;
  line->quantity = draft.quantity;
  line->unit_price = unit_price;
  line->discount_percentage = draft.discount_percentage.value_or(common::Amount{});
  line->discount_amount = aggregate.value->discount_amount;
  line->subtotal = aggregate.value->subtotal;
  line->tax = aggregate.value->tax;
  line->total = aggregate.value->total;
  uow.put(*line);

  if (auto totals = maintainer_.recompute_within(uow, invoice); !totals.ok()) {
    return count_line(LineResult::failure(std::move(totals.status)));
  }
  if (auto status = uow.commit(); !status.ok()) {
    return count_line(LineResult::failure(std::move(status)));
  }
  return count_line(LineResult::success(std::move(*line)));
}

common::Status InvoiceService::remove_line(common::LineId id) {
  store::UnitOfWork uow(store_);
  auto line = uow.get<store::InvoiceLineRow>(id);
  if (!line) {
    return unknown_line(id);
  }
  const auto invoice = line->invoice;
  uow.serialize_on<store::InvoiceRow>(invoice);
  if (!uow.contains<store::InvoiceLineRow>(id)) {
    return unknown_line(id);
  }

  uow.erase<store::InvoiceLineRow>(id);
  if (auto totals = maintainer_.recompute_within(uow, invoice); !totals.ok()) {
    return totals.status;
  }
  auto status = uow.commit();
  if (telemetry_) {
    telemetry_->increment(status.ok() ? telemetry::metrics::kLineMutations : telemetry::metrics::kLinesRejected);
  }
  return status;
}

std::vector<store::InvoiceLineRow> InvoiceService::lines(const common::InvoiceId& id) const {
  return store_.read([&](const store::Tables& tables) {
    std::vector<store::InvoiceLineRow> out;
    tables.invoice_lines.for_each([&](const store::InvoiceLineRow& line) {
      if (line.invoice == id) {
        out.push_back(line);
      }
    });
    return out;
  });
}

common::Result<InvoiceStatistics> InvoiceService::statistics(std::optional<common::Date> from,
                                                             std::optional<common::Date> to) const {
  using StatisticsResult = common::Result<InvoiceStatistics>;

  if (from && to && *from > *to) {
    return StatisticsResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidRange,
                                                    "start date must not be after end date"));
  }

  bool overflow = false;
  auto stats = store_.read([&](const store::Tables& tables) {
    InvoiceStatistics out;
    tables.invoices.for_each([&](const store::InvoiceRow& row) {
      if (overflow || (from && row.issue_date < *from) || (to && row.issue_date > *to)) {
        return;
      }
      const auto grand_total = common::checked_add(out.grand_total, row.totals.grand_total());
      const auto subtotal = common::checked_add(out.subtotal, row.totals.subtotal());
      const auto tax = common::checked_add(out.tax, row.totals.tax());
      const auto discount = common::checked_add(out.discount, row.discount);
      if (!grand_total || !subtotal || !tax || !discount) {
        overflow = true;
        return;
      }
      ++out.count;
      out.grand_total = *grand_total;
      out.subtotal = *subtotal;
      out.tax = *tax;
      out.discount = *discount;
    });
    return out;
  });
  if (overflow) {
    return StatisticsResult::failure(common::reject(common::ErrorKind::kConstraintViolation,
                                                    kRejectCodeStatisticsOverflow,
                                                    "invoice totals exceed the representable range"));
  }
  stats.average_grand_total = average(stats.grand_total, stats.count);
  return StatisticsResult::success(stats);
}

}  // namespace invoice
}  // namespace ledgercore
