#include <tillpoint/sale/cart.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace tillpoint::sale {

Cart::Cart(store::ICatalogStore& store, std::int32_t tax_rate_bp)
    : store_(store), tax_rate_bp_(tax_rate_bp) {}

CartLine* Cart::find(const std::string& product_id) {
  auto it = std::find_if(lines_.begin(), lines_.end(),
                         [&](const CartLine& l) { return l.product_id == product_id; });
  return it != lines_.end() ? &*it : nullptr;
}

std::int32_t Cart::quantity_of(const std::string& product_id) const {
  for (const auto& l : lines_) {
    if (l.product_id == product_id) return l.quantity;
  }
  return 0;
}

std::expected<CartAddition, core::PosError> Cart::add(const core::Product& product) {
  auto current = store_.get_product(product.id);
  if (!current) {
    spdlog::warn("[cart] stock check for {} failed: {}", product.id,
                 core::to_string(current.error()));
    return std::unexpected(current.error());
  }

  const std::int32_t in_cart = quantity_of(product.id);
  if (current->quantity <= in_cart) {
    spdlog::info("[cart] {} rejected, only {} available", product.id, current->quantity);
    return std::unexpected(core::PosError::InsufficientStock);
  }

  CartLine* line = find(product.id);
  if (line) {
    ++line->quantity;
  } else {
    lines_.push_back(CartLine{current->id, current->name, current->category,
                              current->price, 1});
    line = &lines_.back();
  }
  return CartAddition{*line, current->quantity, core::stock_status(*current)};
}

std::expected<void, core::PosError> Cart::update_quantity(const std::string& product_id,
                                                          std::int32_t quantity) {
  if (quantity < 1) {
    remove(product_id);
    return {};
  }
  CartLine* line = find(product_id);
  if (!line) return std::unexpected(core::PosError::ProductNotFound);

  auto current = store_.get_product(product_id);
  if (!current) return std::unexpected(current.error());
  if (quantity > current->quantity) {
    spdlog::info("[cart] {} x{} rejected, only {} available", product_id, quantity,
                 current->quantity);
    return std::unexpected(core::PosError::InsufficientStock);
  }

  line->quantity = quantity;
  return {};
}

void Cart::remove(const std::string& product_id) {
  std::erase_if(lines_, [&](const CartLine& l) { return l.product_id == product_id; });
}

core::Totals Cart::totals() const {
  core::Cents subtotal = 0;
  for (const auto& l : lines_) subtotal += l.line_total();
  return core::totals_for(subtotal, tax_rate_bp_);
}

}  // namespace tillpoint::sale
