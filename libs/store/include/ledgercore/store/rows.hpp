#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "ledgercore/common/amount.hpp"
#include "ledgercore/common/types.hpp"

namespace ledgercore {
namespace invoice {
class TotalMaintainer;
}  // namespace invoice

namespace store {

class ChangeSetCodec;

struct AccountRow {
  common::AccountId id{0};
  std::string code{};
  std::string name{};
  common::AccountClass classification{common::AccountClass::kAsset};

  bool operator==(const AccountRow&) const = default;
};

struct PeriodRow {
  common::PeriodId id{0};
  common::Date start{};
  common::Date end{};
  common::PeriodKind kind{common::PeriodKind::kMonthly};
  common::PeriodState state{common::PeriodState::kOpen};

  bool operator==(const PeriodRow&) const = default;
};

struct TransactionRow {
  common::TransactionId id{0};
  common::Timestamp occurred_at{};
  std::string description{};
  common::TransactionKind kind{common::TransactionKind::kIncome};
  std::string currency{};
  common::Timestamp created_at{};
  std::string created_by{};
  common::PeriodId period{0};

  bool operator==(const TransactionRow&) const = default;
};

struct EntryRow {
  common::EntryId id{0};
  common::TransactionId transaction{0};
  common::AccountId account{0};
  common::Amount debit{};
  common::Amount credit{};

  bool operator==(const EntryRow&) const = default;
};

struct ProductRow {
  common::ProductId id{0};
  std::optional<std::string> code{};
  std::string name{};
  std::string description{};
  common::ProductKind kind{common::ProductKind::kProduct};
  std::string unit{"Unit"};
  common::Amount unit_price{};
  bool taxable{true};
  bool active{true};

  bool operator==(const ProductRow&) const = default;
};

struct ClientRow {
  common::ClientId id{0};
  std::string name{};
  common::ClientKind kind{common::ClientKind::kIndividual};
  std::optional<std::string> tax_id{};
  std::string phone{};
  std::string email{};
  std::string address{};
  bool active{true};

  bool operator==(const ClientRow&) const = default;
};

// Pass-key for writing invoice aggregates. Only the total maintainer (and
// the journal codec rebuilding committed rows) can construct one.
class TotalsKey {
 private:
  TotalsKey() = default;

  friend class invoice::TotalMaintainer;
  friend class ChangeSetCodec;
};

// Aggregate fields of an invoice header: always the sums over the lines
// currently attached to the invoice.
class InvoiceTotals {
 public:
  [[nodiscard]] common::Amount subtotal() const noexcept { return subtotal_; }
  [[nodiscard]] common::Amount tax() const noexcept { return tax_; }
  [[nodiscard]] common::Amount grand_total() const noexcept { return grand_total_; }

  void assign(TotalsKey, common::Amount subtotal, common::Amount tax, common::Amount grand_total) noexcept {
    subtotal_ = subtotal;
    tax_ = tax;
    grand_total_ = grand_total;
  }

  bool operator==(const InvoiceTotals&) const = default;

 private:
  common::Amount subtotal_{};
  common::Amount tax_{};
  common::Amount grand_total_{};
};

struct InvoiceRow {
  common::InvoiceId id{};
  std::string number{};
  std::optional<common::ClientId> client{};
  std::optional<common::TransactionId> transaction{};
  common::Date issue_date{};
  std::optional<common::Date> due_date{};
  std::string payment_terms{};
  std::string salesperson{};
  std::string notes{};
  common::Amount discount{};  // header discount, caller-settable, not derived from lines
  InvoiceTotals totals{};

  bool operator==(const InvoiceRow&) const = default;
};

struct InvoiceLineRow {
  common::LineId id{0};
  common::InvoiceId invoice{};
  common::ProductId product{0};
  common::Amount quantity{};
  common::Amount unit_price{};
  common::Amount discount_percentage{};
  common::Amount discount_amount{};
  common::Amount subtotal{};
  common::Amount tax{};
  common::Amount total{};

  bool operator==(const InvoiceLineRow&) const = default;
};

template <typename Row>
using KeyOf = std::remove_cvref_t<decltype(std::declval<Row>().id)>;

}  // namespace store
}  // namespace ledgercore
