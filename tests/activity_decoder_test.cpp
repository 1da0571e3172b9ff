// =============================================================================
// activity_decoder_test.cpp
// =============================================================================
// Tests for trade feed decoding and deduplication.
//
// Validates:
//   - decodeActivity() maps an activity record to a TradeEvent (seconds →
//     milliseconds, case-insensitive side, numeric strings)
//   - Malformed records raise InvalidEventError / nlohmann exceptions
//   - FeedFilter drops empty ids, repeated ids and other wallets, and
//     advances its cursor
//   - TradeFeedGateway::handlePayload() accepts single objects and batches,
//     forwards in timestamp order and survives bad records
//
// The gateway is exercised without a publisher: handlePayload() is called
// directly, so no message ever arrives on its SUB socket.
// =============================================================================

#include "tradebook/domain/errors.hpp"
#include "tradebook/feed/activity_decoder.hpp"
#include "tradebook/feed/trade_feed_gateway.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using tradebook::domain::Side;
using tradebook::domain::TradeEvent;

namespace {

nlohmann::json makeActivity(const std::string& hash, std::int64_t ts_sec,
                            const std::string& side = "BUY") {
  return nlohmann::json{{"transactionHash", hash},
                        {"timestamp", ts_sec},
                        {"market", "0xmarket"},
                        {"asset", "1234"},
                        {"outcome", "Yes"},
                        {"side", side},
                        {"size", 25.5},
                        {"price", "0.42"},
                        {"user", "0xABCDEF"}};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Field mapping.
// -----------------------------------------------------------------------------
TEST(ActivityDecoderTest, DecodesActivityRecord) {
  std::string wallet;
  TradeEvent fill = tradebook::decodeActivity(makeActivity("0xh1", 1700000000),
                                              &wallet);

  EXPECT_EQ(fill.trade_id, "0xh1");
  EXPECT_EQ(fill.timestamp_ms, 1700000000000);
  EXPECT_EQ(fill.market_id, "0xmarket");
  EXPECT_EQ(fill.token_id, "1234");
  EXPECT_EQ(fill.outcome, "Yes");
  EXPECT_EQ(fill.side, Side::Buy);
  EXPECT_DOUBLE_EQ(fill.size, 25.5);
  EXPECT_DOUBLE_EQ(fill.price, 0.42);
  EXPECT_EQ(wallet, "0xabcdef");
}

TEST(ActivityDecoderTest, SideIsCaseInsensitive) {
  EXPECT_EQ(tradebook::decodeActivity(makeActivity("a", 1, "sell")).side,
            Side::Sell);
  EXPECT_EQ(tradebook::decodeActivity(makeActivity("b", 1, "Buy")).side,
            Side::Buy);
}

// -----------------------------------------------------------------------------
// 2. Bad records.
// -----------------------------------------------------------------------------
TEST(ActivityDecoderTest, UnknownSideThrows) {
  EXPECT_THROW(tradebook::decodeActivity(makeActivity("a", 1, "HOLD")),
               tradebook::InvalidEventError);
}

TEST(ActivityDecoderTest, NonNumericPriceThrows) {
  auto activity = makeActivity("a", 1);
  activity["price"] = "cheap";
  EXPECT_THROW(tradebook::decodeActivity(activity),
               tradebook::InvalidEventError);
}

TEST(ActivityDecoderTest, OutOfRangeTimestampThrows) {
  EXPECT_THROW(tradebook::decodeActivity(makeActivity(
                   "a", std::numeric_limits<std::int64_t>::max())),
               tradebook::InvalidEventError);
  EXPECT_THROW(tradebook::decodeActivity(makeActivity("b", -1)),
               tradebook::InvalidEventError);

  const std::int64_t largest = std::numeric_limits<std::int64_t>::max() / 1000;
  EXPECT_EQ(tradebook::decodeActivity(makeActivity("c", largest)).timestamp_ms,
            largest * 1000);
}

TEST(ActivityDecoderTest, MissingFieldThrows) {
  auto activity = makeActivity("a", 1);
  activity.erase("asset");
  EXPECT_THROW(tradebook::decodeActivity(activity), nlohmann::json::exception);
}

// -----------------------------------------------------------------------------
// 3. FeedFilter.
// -----------------------------------------------------------------------------
TEST(FeedFilterTest, DropsEmptyAndRepeatedIds) {
  tradebook::FeedFilter filter;

  TradeEvent fill;
  fill.timestamp_ms = 5000;
  EXPECT_FALSE(filter.accept(fill));

  fill.trade_id = "t1";
  EXPECT_TRUE(filter.accept(fill));
  EXPECT_FALSE(filter.accept(fill));

  EXPECT_EQ(filter.cursor().last_seen_timestamp_ms, 5000);
  EXPECT_EQ(filter.cursor().seen_trade_ids.count("t1"), 1u);
}

TEST(FeedFilterTest, DropsOtherWallets) {
  tradebook::FeedFilter filter("0xAbC");

  TradeEvent fill;
  fill.trade_id = "t1";
  EXPECT_FALSE(filter.accept(fill, "0xdef"));
  EXPECT_TRUE(filter.accept(fill, "0xabc"));
}

TEST(FeedFilterTest, SeededCursorSuppressesProcessedIds) {
  tradebook::FeedCursor cursor;
  cursor.seen_trade_ids = {"old"};
  cursor.last_seen_timestamp_ms = 9000;
  tradebook::FeedFilter filter({}, cursor);

  TradeEvent fill;
  fill.trade_id = "old";
  EXPECT_FALSE(filter.accept(fill));

  fill.trade_id = "new";
  fill.timestamp_ms = 100;
  EXPECT_TRUE(filter.accept(fill));
  EXPECT_EQ(filter.cursor().last_seen_timestamp_ms, 9000);
}

// -----------------------------------------------------------------------------
// 4. TradeFeedGateway payload handling.
// -----------------------------------------------------------------------------
class TradeFeedGatewayTest : public ::testing::Test {
 protected:
  std::vector<TradeEvent> received;

  std::unique_ptr<tradebook::TradeFeedGateway> makeGateway(
      tradebook::FeedFilter filter = tradebook::FeedFilter{}) {
    return std::make_unique<tradebook::TradeFeedGateway>(
        [this](TradeEvent fill) { received.push_back(std::move(fill)); },
        std::move(filter), "tcp://127.0.0.1:45555");
  }
};

TEST_F(TradeFeedGatewayTest, SingleObjectIsForwarded) {
  auto gateway = makeGateway();
  EXPECT_EQ(gateway->handlePayload(makeActivity("h1", 10).dump()), 1u);
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].trade_id, "h1");
}

TEST_F(TradeFeedGatewayTest, BatchIsForwardedOldestFirst) {
  auto gateway = makeGateway();
  nlohmann::json batch = nlohmann::json::array(
      {makeActivity("h3", 30), makeActivity("h1", 10), makeActivity("h2", 20)});

  EXPECT_EQ(gateway->handlePayload(batch.dump()), 3u);
  ASSERT_EQ(received.size(), 3u);
  EXPECT_EQ(received[0].trade_id, "h1");
  EXPECT_EQ(received[1].trade_id, "h2");
  EXPECT_EQ(received[2].trade_id, "h3");
}

TEST_F(TradeFeedGatewayTest, DuplicatesAcrossPayloadsAreDropped) {
  auto gateway = makeGateway();
  gateway->handlePayload(makeActivity("h1", 10).dump());
  EXPECT_EQ(gateway->handlePayload(makeActivity("h1", 10).dump()), 0u);
  EXPECT_EQ(received.size(), 1u);
}

TEST_F(TradeFeedGatewayTest, BadRecordsAreSkipped) {
  auto gateway = makeGateway();
  auto broken = makeActivity("h2", 20);
  broken.erase("market");
  nlohmann::json batch =
      nlohmann::json::array({makeActivity("h1", 10), broken});

  EXPECT_EQ(gateway->handlePayload(batch.dump()), 1u);
  EXPECT_EQ(gateway->handlePayload("not json at all"), 0u);
  EXPECT_EQ(received.size(), 1u);
}
