#include <tillpoint/store/csv_catalog.hpp>
#include <tillpoint/core/money.hpp>
#include <tillpoint/core/text.hpp>
#include "csv_utils.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <optional>

namespace tillpoint::store {

namespace {

struct Columns {
  int id{-1};
  int name{-1};
  int category{-1};
  int price{-1};
  int cost_price{-1};
  int quantity{-1};
  int low_stock_threshold{-1};
  int barcode{-1};
  int image_url{-1};
};

Columns map_header(const std::vector<std::string>& header) {
  Columns c;
  for (std::size_t i = 0; i < header.size(); ++i) {
    const auto h = core::lower_copy(core::trim_copy(header[i]));
    const int idx = static_cast<int>(i);
    if (h == "id" || h == "product_id") c.id = idx;
    else if (h == "name") c.name = idx;
    else if (h == "category" || h == "category_name") c.category = idx;
    else if (h == "price") c.price = idx;
    else if (h == "cost_price" || h == "costprice") c.cost_price = idx;
    else if (h == "quantity" || h == "stock") c.quantity = idx;
    else if (h == "low_stock_threshold" || h == "lowstockthreshold") c.low_stock_threshold = idx;
    else if (h == "barcode") c.barcode = idx;
    else if (h == "image_url" || h == "imageurl") c.image_url = idx;
  }
  return c;
}

std::string column(const std::vector<std::string>& cols, int idx) {
  if (idx < 0 || idx >= static_cast<int>(cols.size())) return {};
  return core::trim_copy(cols[static_cast<std::size_t>(idx)]);
}

std::optional<std::int32_t> parse_int(const std::string& s) {
  std::int32_t value = 0;
  const auto* end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, value);
  if (ec != std::errc{} || ptr != end) return std::nullopt;
  return value;
}

}  // namespace

std::expected<std::vector<core::Product>, core::PosError>
load_catalog_csv(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("[catalog-csv] cannot open {}", path);
    return std::unexpected(core::PosError::InvalidConfig);
  }

  std::string line;
  if (!read_csv_record(in, line)) return std::unexpected(core::PosError::InvalidConfig);
  const Columns c = map_header(split_csv_line(line));
  if (c.id < 0 || c.name < 0 || c.price < 0 || c.quantity < 0) {
    spdlog::error("[catalog-csv] {} lacks a required column (id, name, price, quantity)", path);
    return std::unexpected(core::PosError::InvalidConfig);
  }

  std::vector<core::Product> products;
  std::size_t record_no = 1;
  while (read_csv_record(in, line)) {
    ++record_no;
    if (core::trim_view(line).empty()) continue;
    const auto cols = split_csv_line(line);

    core::Product p;
    p.id = column(cols, c.id);
    if (p.id.empty()) continue;
    p.name = column(cols, c.name);
    p.category = column(cols, c.category);

    const auto price = core::parse_amount(column(cols, c.price));
    const auto quantity = parse_int(column(cols, c.quantity));
    if (!price || !quantity) {
      spdlog::warn("[catalog-csv] {} record {} skipped, bad price or quantity", path, record_no);
      continue;
    }
    p.price = *price;
    p.quantity = *quantity;

    if (const auto cost = core::parse_amount(column(cols, c.cost_price))) p.cost_price = *cost;
    if (const auto threshold = parse_int(column(cols, c.low_stock_threshold))) {
      p.low_stock_threshold = *threshold;
    }
    if (auto barcode = column(cols, c.barcode); !barcode.empty()) p.barcode = std::move(barcode);
    p.image_url = column(cols, c.image_url);

    products.push_back(std::move(p));
  }

  spdlog::info("[catalog-csv] loaded {} products from {}", products.size(), path);
  return products;
}

}  // namespace tillpoint::store
