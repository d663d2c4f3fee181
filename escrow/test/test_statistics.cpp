#include "ReviewBook.h"
#include "StoreStatistics.h"
#include <gtest/gtest.h>

#include <limits>
#include <thread>
#include <vector>

namespace bz {

TEST(StoreStatisticsTest, MissingStoreIsNotFound) {
  StoreStatistics stats;
  EXPECT_FALSE(stats.has("shop"));
  auto result = stats.get("shop");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, StoreStatistics::E_NOT_FOUND);
}

TEST(StoreStatisticsTest, CreatedOnFirstUpdate) {
  StoreStatistics stats;
  auto record = stats.update("shop", 100, 5);
  EXPECT_EQ(record.totalTransactions, 1u);
  EXPECT_EQ(record.totalRevenue, 100);
  EXPECT_DOUBLE_EQ(record.averageRating, 5.0);
  EXPECT_TRUE(stats.has("shop"));
  EXPECT_EQ(stats.size(), 1u);
}

TEST(StoreStatisticsTest, RunningAverage) {
  StoreStatistics stats;
  stats.update("shop", 10, 5);
  stats.update("shop", 20, 4);
  stats.update("shop", 30, 3);

  auto result = stats.get("shop");
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value().totalTransactions, 3u);
  EXPECT_EQ(result.value().totalRevenue, 60);
  EXPECT_DOUBLE_EQ(result.value().averageRating, 4.0);

  stats.update("shop", 0, 5);
  EXPECT_DOUBLE_EQ(stats.get("shop").value().averageRating, 4.25);
}

TEST(StoreStatisticsTest, RevenueSaturates) {
  StoreStatistics stats;
  stats.update("shop", std::numeric_limits<int64_t>::max() - 1, 3);
  stats.update("shop", 10, 3);
  EXPECT_EQ(stats.get("shop").value().totalRevenue,
            std::numeric_limits<int64_t>::max());
}

TEST(StoreStatisticsTest, StoresAreIndependent) {
  StoreStatistics stats;
  stats.update("shopA", 10, 1);
  stats.update("shopB", 20, 5);
  EXPECT_EQ(stats.getStores(), (std::vector<Principal>{ "shopA", "shopB" }));
  EXPECT_DOUBLE_EQ(stats.get("shopA").value().averageRating, 1.0);
  EXPECT_DOUBLE_EQ(stats.get("shopB").value().averageRating, 5.0);
}

TEST(StoreStatisticsTest, ConcurrentUpdatesOnOneStoreAreSerialized) {
  StoreStatistics stats;
  const int threads = 8;
  const int perThread = 500;

  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&stats, perThread]() {
      for (int i = 0; i < perThread; ++i) {
        stats.update("shop", 2, 4);
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  auto record = stats.get("shop").value();
  EXPECT_EQ(record.totalTransactions,
            static_cast<uint64_t>(threads * perThread));
  EXPECT_EQ(record.totalRevenue, 2 * threads * perThread);
  EXPECT_DOUBLE_EQ(record.averageRating, 4.0);
}

TEST(ReviewBookTest, RecordsSequentialIds) {
  ReviewBook book;
  auto first = book.record("tx1", "shop", "alice", "great", 5, 1000);
  auto second = book.record("tx2", "shop", "bob", "fine", 3, 2000);
  EXPECT_EQ(first.id, 1u);
  EXPECT_EQ(second.id, 2u);
  EXPECT_EQ(book.size(), 2u);

  auto fetched = book.get(2);
  ASSERT_TRUE(fetched.isOk());
  EXPECT_EQ(fetched.value().customer, "bob");
  EXPECT_EQ(fetched.value().rating, 3);
  EXPECT_EQ(fetched.value().timestamp, 2000);
}

TEST(ReviewBookTest, UnknownIdIsNotFound) {
  ReviewBook book;
  EXPECT_EQ(book.get(0).error().code, ReviewBook::E_NOT_FOUND);
  book.record("tx1", "shop", "alice", "ok", 4, 1);
  EXPECT_EQ(book.get(2).error().code, ReviewBook::E_NOT_FOUND);
}

TEST(ReviewBookTest, VisibleToStoreAndAuthor) {
  ReviewBook book;
  book.record("tx1", "shopA", "alice", "a", 5, 1);
  book.record("tx2", "shopB", "alice", "b", 4, 2);
  book.record("tx3", "shopA", "bob", "c", 2, 3);

  auto forShopA = book.getReviewsForStore("shopA");
  ASSERT_EQ(forShopA.size(), 2u);
  EXPECT_EQ(forShopA[0].review, "a");
  EXPECT_EQ(forShopA[1].review, "c");

  auto byAlice = book.getReviewsByCustomer("alice");
  ASSERT_EQ(byAlice.size(), 2u);
  EXPECT_EQ(byAlice[1].store, "shopB");

  EXPECT_TRUE(book.getReviewsForStore("nobody").empty());
}

TEST(ReviewBookTest, ToJsonCarriesAllFields) {
  ReviewBook book;
  auto entry = book.record("tx1", "shop", "alice", "works", 5, 42);
  auto j = entry.toJson();
  EXPECT_EQ(j["id"], 1);
  EXPECT_EQ(j["transactionId"], "tx1");
  EXPECT_EQ(j["review"], "works");
  EXPECT_EQ(j["rating"], 5);
  EXPECT_EQ(j["timestamp"], 42);
}

} // namespace bz
