#include <tillpoint/core/product.hpp>

namespace tillpoint::core {

StockStatus stock_status(const Product& p) noexcept {
  if (p.quantity <= 0) return StockStatus::OutOfStock;
  if (p.quantity <= p.low_stock_threshold) return StockStatus::LowStock;
  return StockStatus::InStock;
}

void apply_patch(Product& product, const ProductPatch& patch) {
  if (patch.name) product.name = *patch.name;
  if (patch.category) product.category = *patch.category;
  if (patch.price) product.price = *patch.price;
  if (patch.cost_price) product.cost_price = *patch.cost_price;
  if (patch.quantity) product.quantity = *patch.quantity;
  if (patch.low_stock_threshold) product.low_stock_threshold = *patch.low_stock_threshold;
  if (patch.barcode) {
    if (patch.barcode->empty()) {
      product.barcode.reset();
    } else {
      product.barcode = *patch.barcode;
    }
  }
  if (patch.image_url) product.image_url = *patch.image_url;
}

}  // namespace tillpoint::core
