#include <tillpoint/app/config.hpp>
#include <tillpoint/app/terminal.hpp>
#include <tillpoint/core/clock.hpp>
#include <tillpoint/scan/key_event.hpp>
#include <tillpoint/store/in_memory_catalog_store.hpp>
#include <tillpoint/store/in_memory_transaction_store.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ta = tillpoint::app;
namespace tc = tillpoint::core;
namespace ts = tillpoint::scan;
namespace tsl = tillpoint::sale;
namespace tst = tillpoint::store;

namespace {

tc::Product product(const std::string& id, const std::string& barcode, tc::Cents price,
                    std::int32_t qty) {
  tc::Product p;
  p.id = id;
  p.name = "Item " + id;
  p.category = "General";
  p.price = price;
  p.quantity = qty;
  p.barcode = barcode;
  return p;
}

/// Terminal over in-memory stores, virtual time and a recorded notification log.
class TerminalSessionTest : public ::testing::Test {
 protected:
  TerminalSessionTest()
      : catalog_({product("p1", "8991234567890", 10000, 50), product("p2", "4800000000002", 5000, 1),
                  product("p3", "4800000000003", 2500, 0), product("p4", "4800000000004", 1000, 4)}),
        terminal_(ta::default_config(), catalog_, transactions_, clock_) {
    terminal_.on_notification([this](const ta::Notification& n) { notes_.push_back(n); });
    EXPECT_TRUE(terminal_.start().has_value());
  }

  /// Scanner burst: characters 2 ms apart, then Enter.
  void scan(const std::string& code) {
    for (const char c : code) {
      terminal_.on_key(ts::key_char(c));
      wait(2);
    }
    terminal_.on_key(ts::key_enter());
  }

  void wait(int ms) {
    for (int i = 0; i < ms; ++i) {
      clock_.advance(tc::Millis{1});
      terminal_.tick();
    }
  }

  [[nodiscard]] bool noted(ta::Severity severity, const std::string& fragment) const {
    for (const auto& n : notes_) {
      if (n.severity == severity && n.message.find(fragment) != std::string::npos) return true;
    }
    return false;
  }

  tc::ManualClock clock_;
  tst::InMemoryCatalogStore catalog_;
  tst::InMemoryTransactionStore transactions_;
  ta::Terminal terminal_;
  std::vector<ta::Notification> notes_;
};

}  // namespace

TEST_F(TerminalSessionTest, ScanTwiceQuicklyAddsOnce) {
  scan("8991234567890");
  wait(40);
  scan("8991234567890");
  wait(200);
  EXPECT_EQ(terminal_.cart().quantity_of("p1"), 1);

  wait(600);
  scan("8991234567890");
  EXPECT_EQ(terminal_.cart().quantity_of("p1"), 2);
}

TEST_F(TerminalSessionTest, SlowTypingCommitsOnInactivity) {
  for (const char c : std::string("8991234567890")) terminal_.on_key(ts::key_char(c));
  EXPECT_EQ(terminal_.decoder(ts::Screen::Sale).state(), ts::DecoderState::Accumulating);
  wait(150);
  EXPECT_EQ(terminal_.cart().quantity_of("p1"), 1);
  EXPECT_TRUE(noted(ta::Severity::Success, "Added Item p1"));
}

TEST_F(TerminalSessionTest, TypingInSearchFieldIsNotAScan) {
  for (const char c : std::string("8991234567890")) {
    terminal_.on_key(ts::key_char(c, ts::FocusTarget::TextField));
  }
  terminal_.on_key(ts::key_enter(ts::FocusTarget::TextField));
  wait(500);
  EXPECT_TRUE(terminal_.cart().empty());
}

TEST_F(TerminalSessionTest, OutOfStockUnknownAndLastUnit) {
  scan("4800000000003");
  EXPECT_TRUE(noted(ta::Severity::Error, "Item p3 is out of stock"));
  wait(600);
  scan("0000000000000");
  EXPECT_TRUE(noted(ta::Severity::Error, "Product not found: 0000000000000"));
  wait(600);
  scan("4800000000002");
  wait(600);
  scan("4800000000002");
  EXPECT_EQ(terminal_.cart().quantity_of("p2"), 1);
  EXPECT_TRUE(noted(ta::Severity::Error, "Not enough stock for Item p2"));
}

TEST_F(TerminalSessionTest, LowStockWarningOnAdd) {
  scan("4800000000004");
  EXPECT_TRUE(noted(ta::Severity::Warning, "Low stock: Item p4"));
}

TEST_F(TerminalSessionTest, SuspendedScreenIgnoresScanner) {
  terminal_.suspend_scanning();
  scan("8991234567890");
  wait(300);
  EXPECT_TRUE(terminal_.cart().empty());
  terminal_.resume_scanning();
  scan("8991234567890");
  EXPECT_EQ(terminal_.cart().quantity_of("p1"), 1);
}

TEST_F(TerminalSessionTest, ScanOnDashboardHandsOffToSale) {
  terminal_.navigate(ts::Screen::Dashboard);
  scan("8991234567890");
  EXPECT_EQ(terminal_.screen(), ts::Screen::Sale);
  EXPECT_EQ(terminal_.cart().quantity_of("p1"), 1);

  // re-entering the sale screen must not add the handed-off product again
  terminal_.navigate(ts::Screen::Reports);
  terminal_.navigate(ts::Screen::Sale);
  EXPECT_EQ(terminal_.cart().quantity_of("p1"), 1);
}

TEST_F(TerminalSessionTest, NavigationDropsPartialScan) {
  terminal_.on_key(ts::key_char('8'));
  terminal_.on_key(ts::key_char('9'));
  terminal_.navigate(ts::Screen::Catalog);
  EXPECT_EQ(terminal_.decoder(ts::Screen::Sale).state(), ts::DecoderState::Idle);
  wait(300);
  EXPECT_FALSE(terminal_.product_form_open());
}

TEST_F(TerminalSessionTest, CatalogScreenDuplicateAndNewProductForm) {
  terminal_.navigate(ts::Screen::Catalog);
  scan("8991234567890");
  EXPECT_TRUE(noted(ta::Severity::Warning, "already registered to Item p1"));
  EXPECT_FALSE(terminal_.product_form_open());

  wait(600);
  scan("1112223334445");
  ASSERT_TRUE(terminal_.product_form_open());
  EXPECT_EQ(terminal_.form_barcode(), "1112223334445");
  EXPECT_TRUE(terminal_.routing_context(ts::Screen::Catalog).suspended());

  // page scanning is suspended while the form is open
  wait(2500);
  scan("9998887776665");
  EXPECT_EQ(terminal_.form_barcode(), "1112223334445");

  terminal_.start_form_barcode_capture();
  for (const char c : std::string("9998887776665")) {
    terminal_.on_key(ts::key_char(c, ts::FocusTarget::ScanField));
  }
  wait(100);
  EXPECT_EQ(terminal_.form_barcode(), "9998887776665");
  EXPECT_FALSE(terminal_.form_capturing());
  EXPECT_TRUE(noted(ta::Severity::Success, "Barcode scanned successfully!"));

  terminal_.close_product_form();
  EXPECT_FALSE(terminal_.routing_context(ts::Screen::Catalog).suspended());
}

TEST_F(TerminalSessionTest, LeavingCatalogClosesProductForm) {
  terminal_.navigate(ts::Screen::Catalog);
  scan("1112223334445");
  ASSERT_TRUE(terminal_.product_form_open());
  EXPECT_EQ(terminal_.routing_context(ts::Screen::Catalog).suspension_depth(), 1);

  terminal_.navigate(ts::Screen::Sale);
  EXPECT_FALSE(terminal_.product_form_open());
  EXPECT_FALSE(terminal_.routing_context(ts::Screen::Catalog).suspended());
  EXPECT_FALSE(terminal_.routing_context(ts::Screen::Sale).suspended());

  // closing again must not resume the Sale context a second time
  terminal_.close_product_form();
  EXPECT_EQ(terminal_.routing_context(ts::Screen::Sale).suspension_depth(), 0);
  EXPECT_EQ(terminal_.routing_context(ts::Screen::Catalog).suspension_depth(), 0);

  terminal_.navigate(ts::Screen::Catalog);
  wait(2500);
  for (const char c : std::string("9998887776665")) {
    EXPECT_EQ(terminal_.on_key(ts::key_char(c)), ts::KeyResult::Buffered);
    wait(2);
  }
  EXPECT_EQ(terminal_.on_key(ts::key_enter()), ts::KeyResult::Committed);
  EXPECT_TRUE(terminal_.product_form_open());
  EXPECT_EQ(terminal_.form_barcode(), "9998887776665");
}

TEST_F(TerminalSessionTest, LeavingCatalogStopsFormCapture) {
  terminal_.navigate(ts::Screen::Catalog);
  terminal_.open_product_form();
  terminal_.start_form_barcode_capture();
  ASSERT_TRUE(terminal_.form_capturing());

  terminal_.navigate(ts::Screen::Sale);
  EXPECT_FALSE(terminal_.form_capturing());

  scan("8991234567890");
  EXPECT_EQ(terminal_.form_barcode(), "");
  ASSERT_EQ(terminal_.cart().lines().size(), 1U);
  EXPECT_EQ(terminal_.cart().lines()[0].product_id, "p1");
}

TEST_F(TerminalSessionTest, CashCheckoutSettlesAndResetsPayment) {
  scan("8991234567890");
  wait(600);
  scan("8991234567890");
  ASSERT_EQ(terminal_.cart().quantity_of("p1"), 2);

  terminal_.payment().received_amount = "300";
  auto receipt = terminal_.checkout();
  ASSERT_TRUE(receipt.has_value());
  EXPECT_EQ(receipt->transaction.total, 22400);
  EXPECT_EQ(receipt->transaction.change, 7600);
  EXPECT_TRUE(terminal_.cart().empty());
  EXPECT_TRUE(terminal_.payment().received_amount.empty());
  EXPECT_EQ(catalog_.get_product("p1")->quantity, 48);
  EXPECT_EQ(terminal_.cache().find_by_token("p1")->quantity, 48);
  EXPECT_TRUE(noted(ta::Severity::Success, "Change: 76.00"));
}

TEST_F(TerminalSessionTest, FailedCheckoutKeepsCartAndPayment) {
  scan("4800000000002");
  terminal_.payment().method = tc::PaymentMethod::Card;
  auto receipt = terminal_.checkout();
  ASSERT_FALSE(receipt.has_value());
  EXPECT_EQ(receipt.error(), tc::PosError::InvalidPayment);
  EXPECT_EQ(terminal_.cart().size(), 1u);
  EXPECT_EQ(terminal_.checkout_state(), tsl::CheckoutState::Collecting);

  terminal_.payment().reference_number = "4111-REF";
  EXPECT_TRUE(terminal_.checkout().has_value());
}

TEST_F(TerminalSessionTest, PartialInventoryFailureGoesToLedger) {
  ASSERT_TRUE(terminal_.add_product("p1").has_value());
  ASSERT_TRUE(terminal_.add_product("p4").has_value());
  catalog_.fail_updates_for("p4");
  terminal_.payment().received_amount = "200";

  auto receipt = terminal_.checkout();
  ASSERT_TRUE(receipt.has_value());
  EXPECT_EQ(receipt->inventory_error(), tc::PosError::InventoryApplyFailure);
  EXPECT_TRUE(terminal_.cart().empty());
  EXPECT_EQ(terminal_.ledger().pending().size(), 1u);
  EXPECT_TRUE(noted(ta::Severity::Warning, "inventory update incomplete"));

  EXPECT_EQ(terminal_.retry_inventory_reconciliation(), 0u);
  catalog_.clear_failures();
  EXPECT_EQ(terminal_.retry_inventory_reconciliation(), 1u);
  EXPECT_TRUE(terminal_.ledger().empty());
  EXPECT_EQ(catalog_.get_product("p4")->quantity, 3);
}

TEST_F(TerminalSessionTest, ManualQuantityEdits) {
  ASSERT_TRUE(terminal_.add_product("p4").has_value());
  EXPECT_EQ(terminal_.update_quantity("p4", 5).error(), tc::PosError::InsufficientStock);
  EXPECT_TRUE(terminal_.update_quantity("p4", 4).has_value());
  EXPECT_EQ(terminal_.cart().quantity_of("p4"), 4);
  terminal_.remove_from_cart("p4");
  EXPECT_TRUE(terminal_.cart().empty());
  EXPECT_EQ(terminal_.add_product("nope").error(), tc::PosError::ProductNotFound);
}

TEST_F(TerminalSessionTest, PeriodicRefreshPicksUpRemoteChanges) {
  tc::Product added = product("p9", "7770000000009", 900, 20);
  catalog_.upsert(added);
  EXPECT_FALSE(terminal_.cache().find_by_token("p9").has_value());
  clock_.advance(tc::Millis{terminal_.config().cache_refresh_period_ms});
  terminal_.tick();
  EXPECT_TRUE(terminal_.cache().find_by_token("p9").has_value());
}
