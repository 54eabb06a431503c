#include <tillpoint/sale/transaction_admin.hpp>
#include <spdlog/spdlog.h>

namespace tillpoint::sale {

std::expected<void, core::PosError> delete_transaction(
    store::ITransactionStore& store, const std::string& id, core::Role role) {
  if (role != core::Role::Admin) {
    spdlog::warn("[admin] delete of {} refused: admin role required", id);
    return std::unexpected(core::PosError::PermissionDenied);
  }
  auto removed = store.delete_transaction(id);
  if (!removed) return std::unexpected(removed.error());
  spdlog::info("[admin] transaction {} deleted", id);
  return {};
}

}  // namespace tillpoint::sale
