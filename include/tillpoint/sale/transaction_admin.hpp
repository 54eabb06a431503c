#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/core/transaction.hpp>
#include <tillpoint/store/transaction_store.hpp>
#include <expected>
#include <string>

namespace tillpoint::sale {

/// Admin only; PermissionDenied for any other role, TransactionNotFound if id is unknown.
[[nodiscard]] std::expected<void, core::PosError> delete_transaction(
    store::ITransactionStore& store, const std::string& id, core::Role role);

}  // namespace tillpoint::sale
