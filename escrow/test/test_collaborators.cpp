#include "Clocks.h"
#include "EngineConfig.h"
#include "EventSinks.h"
#include "MemoryLedger.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <limits>

namespace bz {

// MemoryLedger

TEST(MemoryLedgerTest, CreditAndDeposit) {
  MemoryLedger ledger;
  ASSERT_TRUE(ledger.credit("alice", 100).isOk());
  ASSERT_TRUE(ledger.depositIntoCustody("tx1", "alice", 60).isOk());
  EXPECT_EQ(ledger.getBalance("alice"), 40);
  EXPECT_EQ(ledger.getCustodyBalance("tx1"), 60);
  EXPECT_EQ(ledger.getTotalSupply(), 100);
}

TEST(MemoryLedgerTest, OverdraftIsRejected) {
  MemoryLedger ledger;
  ASSERT_TRUE(ledger.credit("alice", 10).isOk());
  auto result = ledger.depositIntoCustody("tx1", "alice", 11);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, MemoryLedger::E_BALANCE);
  EXPECT_EQ(ledger.getBalance("alice"), 10);
  EXPECT_EQ(ledger.getCustodyBalance("tx1"), 0);

  EXPECT_TRUE(ledger.depositIntoCustody("tx1", "nobody", 1).isError());
}

TEST(MemoryLedgerTest, TransferOutOfCustody) {
  MemoryLedger ledger;
  ASSERT_TRUE(ledger.credit("alice", 100).isOk());
  ASSERT_TRUE(ledger.depositIntoCustody("tx1", "alice", 100).isOk());
  ASSERT_TRUE(ledger.transfer(70, "tx1", "shop").isOk());
  EXPECT_EQ(ledger.getBalance("shop"), 70);
  EXPECT_EQ(ledger.getCustodyBalance("tx1"), 30);

  auto tooMuch = ledger.transfer(31, "tx1", "shop");
  ASSERT_TRUE(tooMuch.isError());
  EXPECT_EQ(tooMuch.error().code, MemoryLedger::E_BALANCE);
  EXPECT_EQ(ledger.getTotalSupply(), 100);
}

TEST(MemoryLedgerTest, UnknownCustodyOnlyAllowsZeroTransfer) {
  MemoryLedger ledger;
  EXPECT_TRUE(ledger.transfer(0, "missing", "alice").isOk());
  auto result = ledger.transfer(1, "missing", "alice");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, MemoryLedger::E_ACCOUNT);
}

TEST(MemoryLedgerTest, NegativeAmountsAreRejected) {
  MemoryLedger ledger;
  EXPECT_EQ(ledger.credit("alice", -1).error().code, MemoryLedger::E_INPUT);
  EXPECT_EQ(ledger.depositIntoCustody("tx", "alice", -1).error().code,
            MemoryLedger::E_INPUT);
  EXPECT_EQ(ledger.transfer(-1, "tx", "alice").error().code,
            MemoryLedger::E_INPUT);
}

// Clocks

TEST(ClockTest, ManualClockMovesOnlyWhenTold) {
  ManualClock clock(100);
  EXPECT_EQ(clock.now(), 100);
  clock.set(1000);
  EXPECT_EQ(clock.now(), 1000);
}

TEST(ClockTest, SystemClockIsWallTime) {
  SystemClock clock;
  Timestamp first = clock.now();
  EXPECT_GT(first, 1600000000000);
  EXPECT_GE(clock.now(), first);
}

// Event sinks

TEST(EventSinkTest, MemorySinkKeepsOrder) {
  MemoryEventSink sink;
  sink.emit({ "tx1", "created", "alice", 1, 0 });
  sink.emit({ "tx2", "created", "bob", 2, 0 });
  sink.emit({ "tx1", "funded", "alice", 3, 50 });

  ASSERT_EQ(sink.size(), 3u);
  auto forTx1 = sink.getEventsForTransaction("tx1");
  ASSERT_EQ(forTx1.size(), 2u);
  EXPECT_EQ(forTx1[1].action, "funded");
  EXPECT_EQ(forTx1[1].amount, 50);

  sink.clear();
  EXPECT_EQ(sink.size(), 0u);
}

TEST(EventSinkTest, FanoutSkipsNullAndForwards) {
  MemoryEventSink first;
  MemoryEventSink second;
  FanoutEventSink fanout;
  fanout.addSink(&first);
  fanout.addSink(nullptr);
  fanout.addSink(&second);

  fanout.emit({ "tx1", "accepted", "shop", 5, 0 });
  EXPECT_EQ(first.size(), 1u);
  EXPECT_EQ(second.size(), 1u);
}

TEST(EventSinkTest, EventToJson) {
  auto j = eventToJson({ "tx1", "released", "alice", 77, 100 });
  EXPECT_EQ(j["transactionId"], "tx1");
  EXPECT_EQ(j["action"], "released");
  EXPECT_EQ(j["principal"], "alice");
  EXPECT_EQ(j["timestamp"], 77);
  EXPECT_EQ(j["amount"], 100);
}

TEST(EventSinkTest, LoggingSinkDoesNotThrow) {
  LoggingEventSink sink("bazaar.test.events");
  EXPECT_NO_THROW(sink.emit({ "tx1", "created", "alice", 1, 0 }));
  EXPECT_EQ(sink.log().getFullName(), "bazaar.test.events");
}

// EngineConfig

TEST(EngineConfigTest, DefaultsWhenEmpty) {
  auto result = EngineConfig::fromJson(nlohmann::json::object());
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value().minRating, 1);
  EXPECT_EQ(result.value().maxRating, 5);
  EXPECT_EQ(result.value().logLevel, logging::Level::INFO);
  EXPECT_TRUE(result.value().logFile.empty());
  EXPECT_TRUE(result.value().logEvents);
}

TEST(EngineConfigTest, ReadsAllKeys) {
  auto jd = nlohmann::json::parse(R"({
    "rating": {"min": 0, "max": 10},
    "log": {"level": "debug", "file": "x.log"},
    "events": {"log": false}
  })");
  auto result = EngineConfig::fromJson(jd);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  const auto &config = result.value();
  EXPECT_EQ(config.minRating, 0);
  EXPECT_EQ(config.maxRating, 10);
  EXPECT_EQ(config.logLevel, logging::Level::DEBUG);
  EXPECT_EQ(config.logFile, "x.log");
  EXPECT_FALSE(config.logEvents);
  EXPECT_TRUE(config.isValidRating(0));
  EXPECT_FALSE(config.isValidRating(11));

  auto again = EngineConfig::fromJson(config.toJson());
  ASSERT_TRUE(again.isOk());
  EXPECT_EQ(again.value().maxRating, 10);
  EXPECT_EQ(again.value().logLevel, logging::Level::DEBUG);
}

TEST(EngineConfigTest, RejectsBadValues) {
  const char *bad[] = {
    R"([])",
    R"({"rating": 5})",
    R"({"rating": {"min": "one"}})",
    R"({"rating": {"min": 4, "max": 2}})",
    R"({"rating": {"max": 9999999999}})",
    R"({"log": {"level": "loud"}})",
    R"({"log": {"file": 3}})",
    R"({"events": {"log": "yes"}})",
  };
  for (const char *text : bad) {
    auto result = EngineConfig::fromJson(nlohmann::json::parse(text));
    ASSERT_TRUE(result.isError()) << text;
    EXPECT_EQ(result.error().code, EngineConfig::E_CONFIG) << text;
  }
}

TEST(EngineConfigTest, LoadFile) {
  auto missing = EngineConfig::loadFile("no_such_bazaar_config.json");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, EngineConfig::E_FILE);

  const std::string path = "bazaar_engine_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"rating": {"min": 2, "max": 3}})";
  }
  auto loaded = EngineConfig::loadFile(path);
  std::remove(path.c_str());
  ASSERT_TRUE(loaded.isOk());
  EXPECT_EQ(loaded.value().minRating, 2);
  EXPECT_EQ(loaded.value().maxRating, 3);
}

} // namespace bz
