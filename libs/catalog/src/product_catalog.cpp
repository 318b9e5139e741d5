#include "ledgercore/catalog/product_catalog.hpp"

#include "ledgercore/store/unit_of_work.hpp"

namespace ledgercore {
namespace catalog {

namespace {
constexpr std::uint16_t kRejectCodeInvalidProduct = 1201;
constexpr std::uint16_t kRejectCodeDuplicateCode = 1202;
constexpr std::uint16_t kRejectCodeUnknownProduct = 1203;
constexpr std::uint16_t kRejectCodeProductInUse = 1204;

using ProductResult = common::Result<store::ProductRow>;

common::Status invalid(std::string message) {
  return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidProduct, std::move(message));
}

common::Status unknown_product(common::ProductId id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownProduct,
                        "product " + std::to_string(id) + " does not exist");
}

common::Status check_draft(const ProductDraft& draft) {
  if (draft.name.empty()) {
    return invalid("product name is required");
  }
  if (draft.code && draft.code->empty()) {
    return invalid("product code must not be empty when given");
  }
  if (draft.unit_price.is_negative()) {
    return invalid("unit price must not be negative");
  }
  return common::ok_status();
}

bool code_taken(const store::UnitOfWork& uow, const std::optional<std::string>& code, common::ProductId self) {
  if (!code) {
    return false;
  }
  return !uow.select<store::ProductRow>([&](const store::ProductRow& row) {
               return row.id != self && row.code == code;
             }).empty();
}

void assign(store::ProductRow& row, const ProductDraft& draft) {
  row.code = draft.code;
  row.name = draft.name;
  row.description = draft.description;
  row.kind = draft.kind;
  row.unit = draft.unit;
  row.unit_price = draft.unit_price;
  row.taxable = draft.taxable;
  row.active = draft.active;
}

}  // namespace

ProductResult ProductCatalog::create(const ProductDraft& draft) {
  if (auto status = check_draft(draft); !status.ok()) {
    return ProductResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  if (code_taken(uow, draft.code, 0)) {
    return ProductResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeDuplicateCode,
                                                 "product code " + *draft.code + " already exists"));
  }

  store::ProductRow row;
  row.id = uow.next_id<store::ProductRow>();
  assign(row, draft);
  uow.put(row);
  if (auto status = uow.commit(); !status.ok()) {
    return ProductResult::failure(std::move(status));
  }
  return ProductResult::success(std::move(row));
}

ProductResult ProductCatalog::update(common::ProductId id, const ProductDraft& draft) {
  if (auto status = check_draft(draft); !status.ok()) {
    return ProductResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  auto row = uow.get<store::ProductRow>(id);
  if (!row) {
    return ProductResult::failure(unknown_product(id));
  }
  if (code_taken(uow, draft.code, id)) {
    return ProductResult::failure(common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeDuplicateCode,
                                                 "product code " + *draft.code + " already exists"));
  }
  assign(*row, draft);
  uow.put(*row);
  if (auto status = uow.commit(); !status.ok()) {
    return ProductResult::failure(std::move(status));
  }
  return ProductResult::success(std::move(*row));
}

common::Status ProductCatalog::deactivate(common::ProductId id) {
  store::UnitOfWork uow(store_);
  auto row = uow.get<store::ProductRow>(id);
  if (!row) {
    return unknown_product(id);
  }
  row->active = false;
  uow.put(*row);
  return uow.commit();
}

common::Status ProductCatalog::remove(common::ProductId id) {
  store::UnitOfWork uow(store_);
  if (!uow.contains<store::ProductRow>(id)) {
    return unknown_product(id);
  }
  const bool in_use = !uow.select<store::InvoiceLineRow>([id](const store::InvoiceLineRow& line) {
                           return line.product == id;
                         }).empty();
  if (in_use) {
    return common::reject(common::ErrorKind::kReferentialIntegrity, kRejectCodeProductInUse,
                          "product " + std::to_string(id) + " is referenced by invoice lines");
  }
  uow.erase<store::ProductRow>(id);
  return uow.commit();
}

ProductResult ProductCatalog::get(common::ProductId id) const {
  return store_.read([&](const store::Tables& tables) {
    if (const auto* row = tables.products.find(id)) {
      return ProductResult::success(*row);
    }
    return ProductResult::failure(unknown_product(id));
  });
}

ProductResult ProductCatalog::find_by_code(std::string_view code) const {
  return store_.read([&](const store::Tables& tables) {
    const store::ProductRow* match = nullptr;
    tables.products.for_each([&](const store::ProductRow& row) {
      if (!match && row.code && *row.code == code) {
        match = &row;
      }
    });
    if (match) {
      return ProductResult::success(*match);
    }
    return ProductResult::failure(common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownProduct,
                                                 "product code " + std::string(code) + " does not exist"));
  });
}

std::vector<store::ProductRow> ProductCatalog::list(bool active_only, common::Page page) const {
  auto rows = store_.read([active_only](const store::Tables& tables) {
    std::vector<store::ProductRow> out;
    tables.products.for_each([&](const store::ProductRow& row) {
      if (!active_only || row.active) {
        out.push_back(row);
      }
    });
    return out;
  });
  return common::slice(std::move(rows), page);
}

}  // namespace catalog
}  // namespace ledgercore
