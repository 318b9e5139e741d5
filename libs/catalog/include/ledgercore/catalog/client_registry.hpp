#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ledgercore/common/paging.hpp"
#include "ledgercore/common/status.hpp"
#include "ledgercore/common/types.hpp"
#include "ledgercore/store/rows.hpp"
#include "ledgercore/store/store.hpp"

namespace ledgercore {
namespace catalog {

struct ClientDraft {
  std::string name;
  common::ClientKind kind{common::ClientKind::kIndividual};
  std::optional<std::string> tax_id;
  std::string phone;
  std::string email;
  std::string address;
  bool active{true};
};

class ClientRegistry {
 public:
  explicit ClientRegistry(store::Store& store) : store_(store) {}

  common::Result<store::ClientRow> create(const ClientDraft& draft);
  common::Result<store::ClientRow> update(common::ClientId id, const ClientDraft& draft);
  common::Status deactivate(common::ClientId id);
  // Invoices of the client keep existing with their client reference cleared.
  common::Status remove(common::ClientId id);

  [[nodiscard]] common::Result<store::ClientRow> get(common::ClientId id) const;
  [[nodiscard]] std::vector<store::ClientRow> list(bool active_only = false, common::Page page = {}) const;

 private:
  store::Store& store_;
};

}  // namespace catalog
}  // namespace ledgercore
