#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/core/product.hpp>
#include <expected>
#include <string>
#include <vector>

namespace tillpoint::store {

/// Loads products from a CSV file with a header row. Header names are
/// case-insensitive; required: id, name, price, quantity. Optional: category,
/// cost_price, low_stock_threshold, barcode, image_url. Prices are decimals
/// ("12.50"). Rows with an empty id or unparsable numbers are skipped.
/// Fails with InvalidConfig if the file cannot be read or a required column is missing.
[[nodiscard]] std::expected<std::vector<core::Product>, core::PosError>
load_catalog_csv(const std::string& path);

}  // namespace tillpoint::store
