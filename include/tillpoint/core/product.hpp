#pragma once

#include <tillpoint/core/money.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace tillpoint::core {

inline constexpr std::int32_t kDefaultLowStockThreshold = 10;

/// Catalog item. The catalog store owns the authoritative record; cache and
/// cart hold copies.
struct Product {
  std::string id;
  std::string name;
  std::string category;
  Cents price{0};
  Cents cost_price{0};
  std::int32_t quantity{0};  // authoritative stock when fetched from the store
  std::int32_t low_stock_threshold{kDefaultLowStockThreshold};
  std::optional<std::string> barcode;
  std::string image_url;
};

/// Partial update for ICatalogStore::update_product; unset fields are left as is.
struct ProductPatch {
  std::optional<std::string> name;
  std::optional<std::string> category;
  std::optional<Cents> price;
  std::optional<Cents> cost_price;
  std::optional<std::int32_t> quantity;
  std::optional<std::int32_t> low_stock_threshold;
  std::optional<std::string> barcode;
  std::optional<std::string> image_url;
};

enum class StockStatus : std::uint8_t {
  InStock,
  LowStock,
  OutOfStock,
};

[[nodiscard]] StockStatus stock_status(const Product& p) noexcept;

/// Applies every set field of patch to product.
void apply_patch(Product& product, const ProductPatch& patch);

}  // namespace tillpoint::core
