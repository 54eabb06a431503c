#include <tillpoint/store/csv_catalog.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace tc = tillpoint::core;
namespace tst = tillpoint::store;

namespace {

class CsvCatalogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("tillpoint_catalog_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
             "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".csv");
  }
  void TearDown() override { std::filesystem::remove(path_); }

  void write(const std::string& content) {
    std::ofstream out(path_);
    out << content;
  }

  std::filesystem::path path_;
};

}  // namespace

TEST_F(CsvCatalogTest, LoadsRowsWithAliasesAndQuotes) {
  write(
      "Product_ID,Name,Category_Name,Price,Stock,Barcode,LowStockThreshold\n"
      "p1,\"Soap, lavender\",Personal Care,45.50,12,8991234567890,5\n"
      "p2,Rice 5kg,Grocery,250,0,,\n");
  auto loaded = tst::load_catalog_csv(path_.string());
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2u);

  const auto& soap = (*loaded)[0];
  EXPECT_EQ(soap.id, "p1");
  EXPECT_EQ(soap.name, "Soap, lavender");
  EXPECT_EQ(soap.category, "Personal Care");
  EXPECT_EQ(soap.price, 4550);
  EXPECT_EQ(soap.quantity, 12);
  EXPECT_EQ(soap.barcode, "8991234567890");
  EXPECT_EQ(soap.low_stock_threshold, 5);

  const auto& rice = (*loaded)[1];
  EXPECT_FALSE(rice.barcode.has_value());
  EXPECT_EQ(rice.low_stock_threshold, tc::kDefaultLowStockThreshold);
}

TEST_F(CsvCatalogTest, SkipsBadRows) {
  write(
      "id,name,price,quantity\n"
      "p1,Good,10,1\n"
      ",No id,10,1\n"
      "p3,Bad price,ten,1\n"
      "p4,Bad qty,10,x\n");
  auto loaded = tst::load_catalog_csv(path_.string());
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1u);
  EXPECT_EQ((*loaded)[0].id, "p1");
}

TEST_F(CsvCatalogTest, MissingRequiredColumnIsInvalidConfig) {
  write("id,name,quantity\np1,Soap,3\n");
  auto loaded = tst::load_catalog_csv(path_.string());
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), tc::PosError::InvalidConfig);
}

TEST(CsvCatalog, MissingFileIsInvalidConfig) {
  auto loaded = tst::load_catalog_csv("/nonexistent/tillpoint/catalog.csv");
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), tc::PosError::InvalidConfig);
}

TEST_F(CsvCatalogTest, QuotedFieldMaySpanLines) {
  write(
      "id,name,price,quantity\r\n"
      "p1,\"Gift set\nwith ribbon\",120,3\r\n"
      "p2,Rice,250,4\r\n");
  auto loaded = tst::load_catalog_csv(path_.string());
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2u);
  EXPECT_EQ((*loaded)[0].name, "Gift set\nwith ribbon");
  EXPECT_EQ((*loaded)[0].quantity, 3);
  EXPECT_EQ((*loaded)[1].id, "p2");
}
