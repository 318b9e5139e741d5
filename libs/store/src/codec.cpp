#include "ledgercore/store/codec.hpp"

#include <chrono>
#include <limits>
#include <optional>
#include <string>

namespace ledgercore {
namespace store {

static_assert(std::endian::native == std::endian::little, "journal format is little-endian");

namespace {

using detail::append_primitive;
using detail::read_primitive;

// Writer helpers

void put_string(std::vector<std::byte>& buffer, const std::string& value) {
  if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw std::length_error("string too long for change set encoding");
  }
  append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(value.size()));
  const auto bytes = std::as_bytes(std::span(value.data(), value.size()));
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void put_amount(std::vector<std::byte>& buffer, common::Amount value) {
  append_primitive<std::int64_t>(buffer, value.cents());
}

void put_date(std::vector<std::byte>& buffer, common::Date value) {
  append_primitive<std::int32_t>(buffer, static_cast<std::int32_t>(value.time_since_epoch().count()));
}

void put_timestamp(std::vector<std::byte>& buffer, common::Timestamp value) {
  append_primitive<std::int64_t>(buffer, value.time_since_epoch().count());
}

template <typename Enum>
void put_enum(std::vector<std::byte>& buffer, Enum value) {
  append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(value));
}

template <typename T, typename PutFn>
void put_optional(std::vector<std::byte>& buffer, const std::optional<T>& value, PutFn&& put) {
  append_primitive<std::uint8_t>(buffer, value ? 1 : 0);
  if (value) {
    put(buffer, *value);
  }
}

void put_key(std::vector<std::byte>& buffer, std::uint32_t key) { append_primitive<std::uint32_t>(buffer, key); }
void put_key(std::vector<std::byte>& buffer, std::uint64_t key) { append_primitive<std::uint64_t>(buffer, key); }
void put_key(std::vector<std::byte>& buffer, const std::string& key) { put_string(buffer, key); }

// Reader helpers

std::string get_string(std::span<const std::byte> data, std::size_t& offset) {
  const auto size = read_primitive<std::uint32_t>(data, offset);
  if (offset + size > data.size()) {
    throw std::runtime_error("change set string out of bounds");
  }
  std::string value(reinterpret_cast<const char*>(data.data() + offset), size);
  offset += size;
  return value;
}

common::Amount get_amount(std::span<const std::byte> data, std::size_t& offset) {
  return common::Amount::from_cents(read_primitive<std::int64_t>(data, offset));
}

common::Date get_date(std::span<const std::byte> data, std::size_t& offset) {
  return common::Date{std::chrono::days{read_primitive<std::int32_t>(data, offset)}};
}

common::Timestamp get_timestamp(std::span<const std::byte> data, std::size_t& offset) {
  return common::Timestamp{std::chrono::seconds{read_primitive<std::int64_t>(data, offset)}};
}

template <typename Enum>
Enum get_enum(std::span<const std::byte> data, std::size_t& offset, Enum last) {
  const auto raw = read_primitive<std::uint8_t>(data, offset);
  if (raw > static_cast<std::uint8_t>(last)) {
    throw std::runtime_error("change set enum value out of range");
  }
  return static_cast<Enum>(raw);
}

bool get_flag(std::span<const std::byte> data, std::size_t& offset) {
  const auto raw = read_primitive<std::uint8_t>(data, offset);
  if (raw > 1) {
    throw std::runtime_error("change set flag out of range");
  }
  return raw == 1;
}

template <typename T, typename GetFn>
std::optional<T> get_optional(std::span<const std::byte> data, std::size_t& offset, GetFn&& get) {
  if (!get_flag(data, offset)) {
    return std::nullopt;
  }
  return get(data, offset);
}

template <typename Key>
Key get_key(std::span<const std::byte> data, std::size_t& offset) {
  if constexpr (std::is_same_v<Key, std::string>) {
    return get_string(data, offset);
  } else {
    return read_primitive<Key>(data, offset);
  }
}

// Rows

void put_row(std::vector<std::byte>& buffer, const AccountRow& row) {
  put_key(buffer, row.id);
  put_string(buffer, row.code);
  put_string(buffer, row.name);
  put_enum(buffer, row.classification);
}

AccountRow get_account(std::span<const std::byte> data, std::size_t& offset) {
  AccountRow row;
  row.id = read_primitive<common::AccountId>(data, offset);
  row.code = get_string(data, offset);
  row.name = get_string(data, offset);
  row.classification = get_enum(data, offset, common::AccountClass::kExpense);
  return row;
}

void put_row(std::vector<std::byte>& buffer, const PeriodRow& row) {
  put_key(buffer, row.id);
  put_date(buffer, row.start);
  put_date(buffer, row.end);
  put_enum(buffer, row.kind);
  put_enum(buffer, row.state);
}

PeriodRow get_period(std::span<const std::byte> data, std::size_t& offset) {
  PeriodRow row;
  row.id = read_primitive<common::PeriodId>(data, offset);
  row.start = get_date(data, offset);
  row.end = get_date(data, offset);
  row.kind = get_enum(data, offset, common::PeriodKind::kAnnual);
  row.state = get_enum(data, offset, common::PeriodState::kClosed);
  return row;
}

void put_row(std::vector<std::byte>& buffer, const TransactionRow& row) {
  put_key(buffer, row.id);
  put_timestamp(buffer, row.occurred_at);
  put_string(buffer, row.description);
  put_enum(buffer, row.kind);
  put_string(buffer, row.currency);
  put_timestamp(buffer, row.created_at);
  put_string(buffer, row.created_by);
  put_key(buffer, row.period);
}

TransactionRow get_transaction(std::span<const std::byte> data, std::size_t& offset) {
  TransactionRow row;
  row.id = read_primitive<common::TransactionId>(data, offset);
  row.occurred_at = get_timestamp(data, offset);
  row.description = get_string(data, offset);
  row.kind = get_enum(data, offset, common::TransactionKind::kExpense);
  row.currency = get_string(data, offset);
  row.created_at = get_timestamp(data, offset);
  row.created_by = get_string(data, offset);
  row.period = read_primitive<common::PeriodId>(data, offset);
  return row;
}

void put_row(std::vector<std::byte>& buffer, const EntryRow& row) {
  put_key(buffer, row.id);
  put_key(buffer, row.transaction);
  put_key(buffer, row.account);
  put_amount(buffer, row.debit);
  put_amount(buffer, row.credit);
}

EntryRow get_entry(std::span<const std::byte> data, std::size_t& offset) {
  EntryRow row;
  row.id = read_primitive<common::EntryId>(data, offset);
  row.transaction = read_primitive<common::TransactionId>(data, offset);
  row.account = read_primitive<common::AccountId>(data, offset);
  row.debit = get_amount(data, offset);
  row.credit = get_amount(data, offset);
  return row;
}

void put_row(std::vector<std::byte>& buffer, const ProductRow& row) {
  put_key(buffer, row.id);
  put_optional(buffer, row.code, put_string);
  put_string(buffer, row.name);
  put_string(buffer, row.description);
  put_enum(buffer, row.kind);
  put_string(buffer, row.unit);
  put_amount(buffer, row.unit_price);
  append_primitive<std::uint8_t>(buffer, row.taxable ? 1 : 0);
  append_primitive<std::uint8_t>(buffer, row.active ? 1 : 0);
}

ProductRow get_product(std::span<const std::byte> data, std::size_t& offset) {
  ProductRow row;
  row.id = read_primitive<common::ProductId>(data, offset);
  row.code = get_optional<std::string>(data, offset, get_string);
  row.name = get_string(data, offset);
  row.description = get_string(data, offset);
  row.kind = get_enum(data, offset, common::ProductKind::kService);
  row.unit = get_string(data, offset);
  row.unit_price = get_amount(data, offset);
  row.taxable = get_flag(data, offset);
  row.active = get_flag(data, offset);
  return row;
}

void put_row(std::vector<std::byte>& buffer, const ClientRow& row) {
  put_key(buffer, row.id);
  put_string(buffer, row.name);
  put_enum(buffer, row.kind);
  put_optional(buffer, row.tax_id, put_string);
  put_string(buffer, row.phone);
  put_string(buffer, row.email);
  put_string(buffer, row.address);
  append_primitive<std::uint8_t>(buffer, row.active ? 1 : 0);
}

ClientRow get_client(std::span<const std::byte> data, std::size_t& offset) {
  ClientRow row;
  row.id = read_primitive<common::ClientId>(data, offset);
  row.name = get_string(data, offset);
  row.kind = get_enum(data, offset, common::ClientKind::kCompany);
  row.tax_id = get_optional<std::string>(data, offset, get_string);
  row.phone = get_string(data, offset);
  row.email = get_string(data, offset);
  row.address = get_string(data, offset);
  row.active = get_flag(data, offset);
  return row;
}

void put_row(std::vector<std::byte>& buffer, const InvoiceRow& row) {
  put_key(buffer, row.id);
  put_string(buffer, row.number);
  put_optional(buffer, row.client, [](auto& out, common::ClientId id) { put_key(out, id); });
  put_optional(buffer, row.transaction, [](auto& out, common::TransactionId id) { put_key(out, id); });
  put_date(buffer, row.issue_date);
  put_optional(buffer, row.due_date, put_date);
  put_string(buffer, row.payment_terms);
  put_string(buffer, row.salesperson);
  put_string(buffer, row.notes);
  put_amount(buffer, row.discount);
  put_amount(buffer, row.totals.subtotal());
  put_amount(buffer, row.totals.tax());
  put_amount(buffer, row.totals.grand_total());
}

void put_row(std::vector<std::byte>& buffer, const InvoiceLineRow& row) {
  put_key(buffer, row.id);
  put_key(buffer, row.invoice);
  put_key(buffer, row.product);
  put_amount(buffer, row.quantity);
  put_amount(buffer, row.unit_price);
  put_amount(buffer, row.discount_percentage);
  put_amount(buffer, row.discount_amount);
  put_amount(buffer, row.subtotal);
  put_amount(buffer, row.tax);
  put_amount(buffer, row.total);
}

InvoiceLineRow get_invoice_line(std::span<const std::byte> data, std::size_t& offset) {
  InvoiceLineRow row;
  row.id = read_primitive<common::LineId>(data, offset);
  row.invoice = get_string(data, offset);
  row.product = read_primitive<common::ProductId>(data, offset);
  row.quantity = get_amount(data, offset);
  row.unit_price = get_amount(data, offset);
  row.discount_percentage = get_amount(data, offset);
  row.discount_amount = get_amount(data, offset);
  row.subtotal = get_amount(data, offset);
  row.tax = get_amount(data, offset);
  row.total = get_amount(data, offset);
  return row;
}

// Tables

template <typename Row>
void put_changes(std::vector<std::byte>& buffer, const Changes<Row>& changes) {
  append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(changes.size()));
  for (const auto& [key, row] : changes) {
    append_primitive<std::uint8_t>(buffer, row ? 1 : 0);
    if (row) {
      put_row(buffer, *row);
    } else {
      put_key(buffer, key);
    }
  }
}

template <typename Row, typename GetRowFn>
void get_changes(std::span<const std::byte> data, std::size_t& offset, Changes<Row>& out, GetRowFn&& get_row) {
  const auto count = read_primitive<std::uint32_t>(data, offset);
  for (std::uint32_t i = 0; i < count; ++i) {
    if (get_flag(data, offset)) {
      Row row = get_row(data, offset);
      auto key = row.id;
      out.insert_or_assign(std::move(key), std::optional<Row>{std::move(row)});
    } else {
      out.insert_or_assign(get_key<KeyOf<Row>>(data, offset), std::optional<Row>{});
    }
  }
}

}  // namespace

std::vector<std::byte> ChangeSetCodec::encode(const ChangeSet& changes) {
  std::vector<std::byte> buffer;
  buffer.reserve(256);
  append_primitive<std::uint8_t>(buffer, kFormatVersion);
  put_changes(buffer, changes.accounts);
  put_changes(buffer, changes.periods);
  put_changes(buffer, changes.transactions);
  put_changes(buffer, changes.entries);
  put_changes(buffer, changes.products);
  put_changes(buffer, changes.clients);
  put_changes(buffer, changes.invoices);
  put_changes(buffer, changes.invoice_lines);
  return buffer;
}

ChangeSet ChangeSetCodec::decode(std::span<const std::byte> data) {
  std::size_t offset = 0;
  if (read_primitive<std::uint8_t>(data, offset) != kFormatVersion) {
    throw std::runtime_error("unsupported change set format version");
  }

  ChangeSet changes;
  get_changes(data, offset, changes.accounts, get_account);
  get_changes(data, offset, changes.periods, get_period);
  get_changes(data, offset, changes.transactions, get_transaction);
  get_changes(data, offset, changes.entries, get_entry);
  get_changes(data, offset, changes.products, get_product);
  get_changes(data, offset, changes.clients, get_client);
  get_changes(data, offset, changes.invoices, &ChangeSetCodec::decode_invoice);
  get_changes(data, offset, changes.invoice_lines, get_invoice_line);

  if (offset != data.size()) {
    throw std::runtime_error("trailing bytes after change set");
  }
  return changes;
}

InvoiceRow ChangeSetCodec::decode_invoice(std::span<const std::byte> data, std::size_t& offset) {
  InvoiceRow row;
  row.id = get_string(data, offset);
  row.number = get_string(data, offset);
  row.client = get_optional<common::ClientId>(data, offset, read_primitive<common::ClientId>);
  row.transaction = get_optional<common::TransactionId>(data, offset, read_primitive<common::TransactionId>);
  row.issue_date = get_date(data, offset);
  row.due_date = get_optional<common::Date>(data, offset, get_date);
  row.payment_terms = get_string(data, offset);
  row.salesperson = get_string(data, offset);
  row.notes = get_string(data, offset);
  row.discount = get_amount(data, offset);
  const auto subtotal = get_amount(data, offset);
  const auto tax = get_amount(data, offset);
  const auto grand_total = get_amount(data, offset);
  row.totals.assign(TotalsKey{}, subtotal, tax, grand_total);
  return row;
}

}  // namespace store
}  // namespace ledgercore
