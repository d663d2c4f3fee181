#include "AuthGuard.h"
#include "DeadlinePolicy.h"
#include "Transaction.h"
#include <gtest/gtest.h>

#include <limits>

namespace bz {

namespace {

Transaction makeTransaction() {
  Transaction tx;
  tx.id = "tx";
  tx.customer = "alice";
  return tx;
}

} // namespace

TEST(AuthGuardTest, CustomerOnly) {
  auto tx = makeTransaction();
  tx.store = "shop";
  EXPECT_TRUE(guard::isAllowed("alice", Role::CustomerOnly, tx));
  EXPECT_FALSE(guard::isAllowed("shop", Role::CustomerOnly, tx));
  EXPECT_FALSE(guard::isAllowed("mallory", Role::CustomerOnly, tx));
}

TEST(AuthGuardTest, StoreOnlyRequiresAssignedStore) {
  auto tx = makeTransaction();
  EXPECT_FALSE(guard::isAllowed("shop", Role::StoreOnly, tx));
  EXPECT_FALSE(guard::isAllowed("", Role::StoreOnly, tx));

  tx.store = "shop";
  EXPECT_TRUE(guard::isAllowed("shop", Role::StoreOnly, tx));
  EXPECT_FALSE(guard::isAllowed("alice", Role::StoreOnly, tx));
}

TEST(AuthGuardTest, CustomerOrStore) {
  auto tx = makeTransaction();
  EXPECT_TRUE(guard::isAllowed("alice", Role::CustomerOrStore, tx));
  EXPECT_FALSE(guard::isAllowed("shop", Role::CustomerOrStore, tx));

  tx.store = "shop";
  EXPECT_TRUE(guard::isAllowed("shop", Role::CustomerOrStore, tx));
  EXPECT_FALSE(guard::isAllowed("mallory", Role::CustomerOrStore, tx));
}

TEST(DeadlinePolicyTest, WindowsAreStrictAndDisjoint) {
  EXPECT_TRUE(deadline::isBefore(999, 1000));
  EXPECT_FALSE(deadline::isBefore(1000, 1000));
  EXPECT_FALSE(deadline::isAfter(1000, 1000));
  EXPECT_TRUE(deadline::isAfter(1001, 1000));

  for (Timestamp now = 990; now <= 1010; ++now) {
    EXPECT_FALSE(deadline::isBefore(now, 1000) && deadline::isAfter(now, 1000));
  }
}

TEST(DeadlinePolicyTest, ComputeDeadlineRejectsBadDurations) {
  Timestamp out = 0;
  EXPECT_TRUE(deadline::computeDeadline(500, 1000, out));
  EXPECT_EQ(out, 1500);

  out = 7;
  EXPECT_FALSE(deadline::computeDeadline(500, -1, out));
  EXPECT_FALSE(deadline::computeDeadline(std::numeric_limits<int64_t>::max(), 1,
                                         out));
  EXPECT_EQ(out, 7);
}

TEST(DeadlinePolicyTest, ExtendDeadline) {
  Timestamp out = 0;
  EXPECT_TRUE(deadline::extendDeadline(1500, 0, out));
  EXPECT_EQ(out, 1500);
  EXPECT_TRUE(deadline::extendDeadline(1500, 250, out));
  EXPECT_EQ(out, 1750);
  EXPECT_FALSE(deadline::extendDeadline(1500, -250, out));
}

TEST(TransactionTest, ResetEpisodeClearsCounterpartState) {
  auto tx = makeTransaction();
  tx.store = "shop";
  tx.fulfilled = true;
  tx.dispute = true;
  tx.rating = 4;
  tx.ratedEpisode = tx.episode;

  tx.resetEpisode(Status::Refunded);

  EXPECT_FALSE(tx.hasStore());
  EXPECT_FALSE(tx.fulfilled);
  EXPECT_FALSE(tx.dispute);
  EXPECT_EQ(tx.status, Status::Refunded);
  EXPECT_EQ(tx.episode, 2u);
  ASSERT_TRUE(tx.rating.has_value());
  EXPECT_FALSE(tx.isRatedThisEpisode());
}

TEST(TransactionTest, ToJsonUsesNullForAbsentFields) {
  auto tx = makeTransaction();
  auto j = tx.toJson();
  EXPECT_TRUE(j["store"].is_null());
  EXPECT_TRUE(j["rating"].is_null());
  EXPECT_EQ(j["status"], "open");
  EXPECT_EQ(j["customer"], "alice");

  tx.store = "shop";
  tx.status = Status::Accepted;
  j = tx.toJson();
  EXPECT_EQ(j["store"], "shop");
  EXPECT_EQ(j["status"], "accepted");
}

TEST(StatusTest, NamesRoundTrip) {
  Status status = Status::Open;
  EXPECT_TRUE(parseStatus("disputed", status));
  EXPECT_EQ(status, Status::Disputed);
  EXPECT_FALSE(parseStatus("Disputed", status));
  EXPECT_FALSE(parseStatus("shipped", status));
  EXPECT_EQ(statusToString(Status::Refunded), "refunded");
  EXPECT_EQ(roleToString(Role::StoreOnly), "store");
}

} // namespace bz
