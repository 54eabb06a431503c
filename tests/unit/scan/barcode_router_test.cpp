#include <tillpoint/catalog/catalog_cache.hpp>
#include <tillpoint/core/clock.hpp>
#include <tillpoint/scan/barcode_router.hpp>
#include <tillpoint/scan/handoff_mailbox.hpp>
#include <tillpoint/scan/routing_context.hpp>
#include <tillpoint/store/in_memory_catalog_store.hpp>
#include <gtest/gtest.h>

namespace tc = tillpoint::core;
namespace tcat = tillpoint::catalog;
namespace ts = tillpoint::scan;
namespace tst = tillpoint::store;

namespace {

tc::Product product(const std::string& id, const std::string& barcode, std::int32_t qty) {
  tc::Product p;
  p.id = id;
  p.name = "Item " + id;
  p.price = 1000;
  p.quantity = qty;
  p.barcode = barcode;
  return p;
}

class BarcodeRouterTest : public ::testing::Test {
 protected:
  BarcodeRouterTest()
      : store_({product("p1", "8991234567890", 5), product("p2", "4800000000002", 0),
                product("p3", "4800000000003", 2)}),
        cache_(store_, clock_, tc::Millis{0}),
        mailbox_(clock_, tc::Millis{1000}),
        router_(cache_, mailbox_, clock_) {
    EXPECT_TRUE(cache_.refresh().has_value());
  }

  std::expected<ts::RoutedAction, tc::PosError> route(const std::string& token, ts::Screen screen) {
    return router_.route(token, screen, contexts_[static_cast<int>(screen)]);
  }

  /// Moves past the processing hold.
  void settle() { clock_.advance(tc::Millis{301}); }

  tc::ManualClock clock_;
  tst::InMemoryCatalogStore store_;
  tcat::CatalogCache cache_;
  ts::HandoffMailbox mailbox_;
  ts::BarcodeRouter router_;
  ts::RoutingContext contexts_[6];
};

}  // namespace

TEST_F(BarcodeRouterTest, SaleScreenAddsToCart) {
  auto action = route("8991234567890", ts::Screen::Sale);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->kind, ts::RouteKind::AddToCart);
  ASSERT_TRUE(action->product.has_value());
  EXPECT_EQ(action->product->id, "p1");
}

TEST_F(BarcodeRouterTest, IdTokenResolvesWhenNoBarcodeMatches) {
  auto action = route("p3", ts::Screen::Sale);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->product->id, "p3");
}

TEST_F(BarcodeRouterTest, UnknownAndOutOfStock) {
  EXPECT_EQ(route("0000000000000", ts::Screen::Sale).error(), tc::PosError::UnknownBarcode);
  settle();
  EXPECT_EQ(route("4800000000002", ts::Screen::Sale).error(), tc::PosError::OutOfStock);
  settle();
  EXPECT_EQ(route("4800000000002", ts::Screen::Dashboard).error(), tc::PosError::OutOfStock);
  EXPECT_FALSE(mailbox_.has_payload());
}

TEST_F(BarcodeRouterTest, CatalogScreenDuplicateOrCreate) {
  EXPECT_EQ(route("8991234567890", ts::Screen::Catalog).error(), tc::PosError::DuplicateBarcode);
  settle();
  // out-of-stock products are still registered barcodes
  EXPECT_EQ(route("4800000000002", ts::Screen::Catalog).error(), tc::PosError::DuplicateBarcode);
  settle();
  auto create = route("1112223334445", ts::Screen::Catalog);
  ASSERT_TRUE(create.has_value());
  EXPECT_EQ(create->kind, ts::RouteKind::CreateProduct);
  EXPECT_EQ(create->token, "1112223334445");
  EXPECT_FALSE(create->product.has_value());
}

TEST_F(BarcodeRouterTest, OtherScreensHandOffThroughMailbox) {
  for (auto screen : {ts::Screen::Dashboard, ts::Screen::SalesHistory, ts::Screen::Reports,
                      ts::Screen::Settings}) {
    settle();
    auto action = route("8991234567890", screen);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->kind, ts::RouteKind::HandoffToSale);
    ASSERT_TRUE(mailbox_.has_payload());
    mailbox_.clear();
  }
}

TEST_F(BarcodeRouterTest, SameTokenTwiceWithin40msRoutesOnce) {
  ASSERT_TRUE(route("8991234567890", ts::Screen::Sale).has_value());
  clock_.advance(tc::Millis{40});
  auto second = route("8991234567890", ts::Screen::Sale);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), tc::PosError::InputDiscarded);
}

TEST_F(BarcodeRouterTest, ProcessingHoldDropsOtherTokens) {
  ASSERT_TRUE(route("8991234567890", ts::Screen::Sale).has_value());
  clock_.advance(tc::Millis{299});
  EXPECT_TRUE(router_.in_flight());
  EXPECT_EQ(route("4800000000003", ts::Screen::Sale).error(), tc::PosError::InputDiscarded);
  clock_.advance(tc::Millis{1});
  EXPECT_FALSE(router_.in_flight());
  EXPECT_TRUE(route("4800000000003", ts::Screen::Sale).has_value());
}

TEST_F(BarcodeRouterTest, DedupWindowIsPerScreen) {
  ASSERT_TRUE(route("8991234567890", ts::Screen::Sale).has_value());
  clock_.advance(tc::Millis{500});
  EXPECT_TRUE(route("8991234567890", ts::Screen::Sale).has_value());

  clock_.advance(tc::Millis{500});
  ASSERT_EQ(route("8991234567890", ts::Screen::Catalog).error(), tc::PosError::DuplicateBarcode);
  clock_.advance(tc::Millis{1999});
  EXPECT_EQ(route("8991234567890", ts::Screen::Catalog).error(), tc::PosError::InputDiscarded);
  clock_.advance(tc::Millis{1});
  EXPECT_EQ(route("8991234567890", ts::Screen::Catalog).error(), tc::PosError::DuplicateBarcode);
}

TEST(DedupPolicy, StandardTable) {
  const auto policy = ts::DedupPolicy::standard();
  EXPECT_EQ(policy.window_for(ts::Screen::Sale), tc::Millis{500});
  EXPECT_EQ(policy.window_for(ts::Screen::Catalog), tc::Millis{2000});
  EXPECT_EQ(policy.window_for(ts::Screen::Reports), tc::Millis{2000});
}
