#include "ledgercore/catalog/client_registry.hpp"

#include "ledgercore/store/unit_of_work.hpp"

namespace ledgercore {
namespace catalog {

namespace {
constexpr std::uint16_t kRejectCodeInvalidClient = 1301;
constexpr std::uint16_t kRejectCodeDuplicateTaxId = 1302;
constexpr std::uint16_t kRejectCodeUnknownClient = 1303;

using ClientResult = common::Result<store::ClientRow>;

common::Status unknown_client(common::ClientId id) {
  return common::reject(common::ErrorKind::kNotFound, kRejectCodeUnknownClient,
                        "client " + std::to_string(id) + " does not exist");
}

common::Status check_draft(const ClientDraft& draft) {
  if (draft.name.empty()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidClient, "client name is required");
  }
  if (draft.tax_id && draft.tax_id->empty()) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeInvalidClient,
                          "client tax id must not be empty when given");
  }
  return common::ok_status();
}

common::Status check_tax_id(const store::UnitOfWork& uow, const ClientDraft& draft, common::ClientId self) {
  if (!draft.tax_id) {
    return common::ok_status();
  }
  const bool taken = !uow.select<store::ClientRow>([&](const store::ClientRow& row) {
                        return row.id != self && row.tax_id == draft.tax_id;
                      }).empty();
  if (taken) {
    return common::reject(common::ErrorKind::kConstraintViolation, kRejectCodeDuplicateTaxId,
                          "client tax id " + *draft.tax_id + " already exists");
  }
  return common::ok_status();
}

void assign(store::ClientRow& row, const ClientDraft& draft) {
  row.name = draft.name;
  row.kind = draft.kind;
  row.tax_id = draft.tax_id;
  row.phone = draft.phone;
  row.email = draft.email;
  row.address = draft.address;
  row.active = draft.active;
}

}  // namespace

ClientResult ClientRegistry::create(const ClientDraft& draft) {
  if (auto status = check_draft(draft); !status.ok()) {
    return ClientResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  if (auto status = check_tax_id(uow, draft, 0); !status.ok()) {
    return ClientResult::failure(std::move(status));
  }
  store::ClientRow row;
  row.id = uow.next_id<store::ClientRow>();
  assign(row, draft);
  uow.put(row);
  if (auto status = uow.commit(); !status.ok()) {
    return ClientResult::failure(std::move(status));
  }
  return ClientResult::success(std::move(row));
}

ClientResult ClientRegistry::update(common::ClientId id, const ClientDraft& draft) {
  if (auto status = check_draft(draft); !status.ok()) {
    return ClientResult::failure(std::move(status));
  }

  store::UnitOfWork uow(store_);
  auto row = uow.get<store::ClientRow>(id);
  if (!row) {
    return ClientResult::failure(unknown_client(id));
  }
  if (auto status = check_tax_id(uow, draft, id); !status.ok()) {
    return ClientResult::failure(std::move(status));
  }
  assign(*row, draft);
  uow.put(*row);
  if (auto status = uow.commit(); !status.ok()) {
    return ClientResult::failure(std::move(status));
  }
  return ClientResult::success(std::move(*row));
}

common::Status ClientRegistry::deactivate(common::ClientId id) {
  store::UnitOfWork uow(store_);
  auto row = uow.get<store::ClientRow>(id);
  if (!row) {
    return unknown_client(id);
  }
  row->active = false;
  uow.put(*row);
  return uow.commit();
}

common::Status ClientRegistry::remove(common::ClientId id) {
  store::UnitOfWork uow(store_);
  if (!uow.contains<store::ClientRow>(id)) {
    return unknown_client(id);
  }

  auto invoices = uow.select<store::InvoiceRow>([id](const store::InvoiceRow& row) { return row.client == id; });
  // select() is ordered by key, so row locks are always taken in the same order.
  for (const auto& invoice : invoices) {
    uow.serialize_on<store::InvoiceRow>(invoice.id);
  }
  for (const auto& invoice : invoices) {
    auto current = uow.get<store::InvoiceRow>(invoice.id);
    if (!current) {
      continue;
    }
    current->client.reset();
    uow.put(std::move(*current));
  }

  uow.erase<store::ClientRow>(id);
  return uow.commit();
}

ClientResult ClientRegistry::get(common::ClientId id) const {
  return store_.read([&](const store::Tables& tables) {
    if (const auto* row = tables.clients.find(id)) {
      return ClientResult::success(*row);
    }
    return ClientResult::failure(unknown_client(id));
  });
}

std::vector<store::ClientRow> ClientRegistry::list(bool active_only, common::Page page) const {
  auto rows = store_.read([active_only](const store::Tables& tables) {
    std::vector<store::ClientRow> out;
    tables.clients.for_each([&](const store::ClientRow& row) {
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
