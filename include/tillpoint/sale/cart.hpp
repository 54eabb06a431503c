#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/core/money.hpp>
#include <tillpoint/core/product.hpp>
#include <tillpoint/core/transaction.hpp>
#include <tillpoint/store/catalog_store.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace tillpoint::sale {

/// Cart entry. Name, category and price are a snapshot taken when the line was
/// created; product_id refers back into the catalog.
struct CartLine {
  std::string product_id;
  std::string name;
  std::string category;
  core::Cents unit_price{0};
  std::int32_t quantity{0};

  [[nodiscard]] core::Cents line_total() const noexcept { return unit_price * quantity; }
};

/// Result of a successful add: the updated line and the stock it was checked against.
struct CartAddition {
  CartLine line;
  std::int32_t available{0};
  core::StockStatus stock{core::StockStatus::InStock};
};

/// Sale in progress. Every stock-affecting mutation re-reads the product from
/// the catalog store first, so a line never exceeds the last stock observed.
/// That check narrows but does not close the race with other terminals.
class Cart {
 public:
  explicit Cart(store::ICatalogStore& store,
                std::int32_t tax_rate_bp = core::kDefaultTaxRateBp);

  /// Adds one unit. InsufficientStock if stock <= quantity already in the cart.
  [[nodiscard]] std::expected<CartAddition, core::PosError> add(const core::Product& product);

  /// quantity < 1 removes the line. InsufficientStock if quantity > stock;
  /// ProductNotFound if the product is not in the cart.
  [[nodiscard]] std::expected<void, core::PosError> update_quantity(
      const std::string& product_id, std::int32_t quantity);

  void remove(const std::string& product_id);
  void clear() noexcept { lines_.clear(); }

  [[nodiscard]] const std::vector<CartLine>& lines() const noexcept { return lines_; }
  [[nodiscard]] bool empty() const noexcept { return lines_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return lines_.size(); }
  [[nodiscard]] std::int32_t quantity_of(const std::string& product_id) const;

  [[nodiscard]] core::Totals totals() const;
  [[nodiscard]] std::int32_t tax_rate_bp() const noexcept { return tax_rate_bp_; }

 private:
  [[nodiscard]] CartLine* find(const std::string& product_id);

  store::ICatalogStore& store_;
  std::int32_t tax_rate_bp_;
  std::vector<CartLine> lines_;
};

}  // namespace tillpoint::sale
