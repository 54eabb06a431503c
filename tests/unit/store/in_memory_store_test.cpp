#include <tillpoint/store/in_memory_catalog_store.hpp>
#include <tillpoint/store/in_memory_transaction_store.hpp>
#include <gtest/gtest.h>

namespace tc = tillpoint::core;
namespace tst = tillpoint::store;

namespace {

tc::Product product(const std::string& id, std::int32_t quantity) {
  tc::Product p;
  p.id = id;
  p.name = "Item " + id;
  p.price = 1000;
  p.quantity = quantity;
  return p;
}

}  // namespace

TEST(InMemoryCatalogStore, GetAndUpdate) {
  tst::InMemoryCatalogStore store({product("a", 5), product("b", 1)});

  auto a = store.get_product("a");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->quantity, 5);

  tc::ProductPatch patch;
  patch.quantity = 3;
  auto updated = store.update_product("a", patch);
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->quantity, 3);
  EXPECT_EQ(store.get_product("a")->quantity, 3);
  EXPECT_EQ(store.update_count(), 1u);
}

TEST(InMemoryCatalogStore, UnknownIdIsProductNotFound) {
  tst::InMemoryCatalogStore store({product("a", 5)});
  EXPECT_EQ(store.get_product("zzz").error(), tc::PosError::ProductNotFound);
  EXPECT_EQ(store.update_product("zzz", {}).error(), tc::PosError::ProductNotFound);
}

TEST(InMemoryCatalogStore, FailureSwitches) {
  tst::InMemoryCatalogStore store({product("a", 5), product("b", 5)});
  store.fail_updates_for("b");
  tc::ProductPatch patch;
  patch.quantity = 1;
  EXPECT_TRUE(store.update_product("a", patch).has_value());
  EXPECT_EQ(store.update_product("b", patch).error(), tc::PosError::StoreUnavailable);

  store.set_unavailable(true);
  EXPECT_EQ(store.list_products().error(), tc::PosError::StoreUnavailable);
  EXPECT_EQ(store.get_product("a").error(), tc::PosError::StoreUnavailable);

  store.clear_failures();
  EXPECT_TRUE(store.list_products().has_value());
  EXPECT_TRUE(store.update_product("b", patch).has_value());
}

TEST(InMemoryCatalogStore, UpsertReplacesInPlace) {
  tst::InMemoryCatalogStore store({product("a", 5), product("b", 5)});
  store.upsert(product("a", 9));
  auto all = store.list_products();
  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 2u);
  EXPECT_EQ((*all)[0].id, "a");
  EXPECT_EQ((*all)[0].quantity, 9);
}

TEST(InMemoryTransactionStore, CreateIsNotIdempotent) {
  tst::InMemoryTransactionStore store;
  tc::Transaction t;
  t.id = "TXN-1";
  ASSERT_TRUE(store.create_transaction(t).has_value());
  ASSERT_TRUE(store.create_transaction(t).has_value());
  EXPECT_EQ(store.list_transactions()->size(), 2u);
}

TEST(InMemoryTransactionStore, DeleteAndFailures) {
  tst::InMemoryTransactionStore store;
  tc::Transaction t;
  t.id = "TXN-1";
  ASSERT_TRUE(store.create_transaction(t).has_value());

  EXPECT_EQ(store.delete_transaction("TXN-2").error(), tc::PosError::TransactionNotFound);
  EXPECT_TRUE(store.delete_transaction("TXN-1").has_value());
  EXPECT_TRUE(store.list_transactions()->empty());

  store.set_fail_writes(true);
  EXPECT_EQ(store.create_transaction(t).error(), tc::PosError::StoreUnavailable);
}
