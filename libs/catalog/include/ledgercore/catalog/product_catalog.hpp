#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ledgercore/common/amount.hpp"
#include "ledgercore/common/paging.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace catalog {

struct ProductDraft {
  std::optional<std::string> code;
  std::string name;
  std::string description;
  common::ProductKind kind{common::ProductKind::kProduct};
  std::string unit{"Unit"};
  common::Amount unit_price{};
  bool taxable{true};
  bool active{true};
};

// Products and services that invoice lines reference. A product used by any
// invoice line cannot be removed; deactivate it instead.
class ProductCatalog {
 public:
  explicit ProductCatalog(store::Store& store) : store_(store) {}

  common::Result<store::ProductRow> create(const ProductDraft& draft);
  common::Result<store::ProductRow> update(common::ProductId id, const ProductDraft& draft);
  common::Status deactivate(common::ProductId id);
  common::Status remove(common::ProductId id);

  [[nodiscard]] common::Result<store::ProductRow> get(common::ProductId id) const;
  [[nodiscard]] common::Result<store::ProductRow> find_by_code(std::string_view code) const;
  [[nodiscard]] std::vector<store::ProductRow> list(bool active_only = false, common::Page page = {}) const;

 private:
  store::Store& store_;
};

}  // namespace catalog
}  // namespace ledgercore
