// =============================================================================
// state_store_test.cpp
// =============================================================================
// Tests for snapshot persistence and resumption.
//
// Validates:
//   - JsonFileStateStore save/load through a real file
//   - Missing file → std::nullopt; malformed or wrong-version file →
//     StateStoreError
//   - The temp file used for the atomic rename does not linger
//   - Resumption: processing a prefix of a fill sequence, saving, loading
//     into a fresh ledger and processing the remainder yields the same
//     final state as processing the whole sequence, for every prefix
//   - Re-delivered fills after resumption are skipped by the seen-id cursor
// =============================================================================

#include "tradebook/classification/classification_engine.hpp"
#include "tradebook/domain/errors.hpp"
#include "tradebook/eventbus/event_bus.hpp"
#include "tradebook/ledger/position_ledger.hpp"
#include "tradebook/persistence/json_state_store.hpp"
#include "tradebook/persistence/snapshot_json.hpp"
#include "tradebook/tracking/fill_processor.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using tradebook::domain::Side;
using tradebook::domain::TradeEvent;

namespace {

TradeEvent makeFill(const std::string& id, const std::string& token,
                    Side side, double size, double price, std::int64_t ts) {
  TradeEvent e;
  e.trade_id = id;
  e.token_id = token;
  e.market_id = token == "up" || token == "down" ? "m1" : "m2";
  e.outcome = token == "up" ? "Up" : token == "down" ? "Down" : token;
  e.side = side;
  e.size = size;
  e.price = price;
  e.timestamp_ms = ts;
  return e;
}

// Touches every classification kind across two markets.
std::vector<TradeEvent> sampleSequence() {
  return {
      makeFill("f1", "up", Side::Buy, 100.0, 0.60, 1000),
      makeFill("f2", "up", Side::Buy, 50.0, 0.65, 2000),
      makeFill("f3", "yes", Side::Buy, 20.0, 0.30, 2500),
      makeFill("f4", "up", Side::Sell, 40.0, 0.70, 3000),
      makeFill("f5", "down", Side::Buy, 30.0, 0.35, 4000),
      makeFill("f6", "up", Side::Sell, 100.0, 0.55, 5000),
      makeFill("f7", "yes", Side::Sell, 20.0, 0.45, 6000),
      makeFill("f8", "down", Side::Sell, 30.0, 0.40, 7000),
      makeFill("f9", "up", Side::Buy, 20.0, 0.50, 8000),
  };
}

}  // namespace

// =============================================================================
// Test fixture: a per-test snapshot path under the system temp directory.
// =============================================================================
class StateStoreTest : public ::testing::Test {
 protected:
  std::filesystem::path path;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = std::filesystem::temp_directory_path() /
           (std::string("tradebook_state_") + info->name() + ".json");
    std::filesystem::remove(path);
  }

  void TearDown() override {
    std::filesystem::remove(path);
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    std::filesystem::remove(tmp);
  }

  void writeRaw(const std::string& text) {
    std::ofstream out(path);
    out << text;
  }

  // Runs fills through a FillProcessor bound to the given ledger.
  static void runFills(tradebook::PositionLedger& ledger,
                       const std::vector<TradeEvent>& fills,
                       tradebook::IStateStore* store = nullptr) {
    tradebook::EventBus bus;
    tradebook::ClassificationEngine engine;
    tradebook::FillProcessor processor(bus, ledger, engine, store);
    for (const auto& f : fills) {
      processor.process(f);
    }
  }
};

// -----------------------------------------------------------------------------
// 1. No file yet → nullopt, not an error.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, MissingFileLoadsNothing) {
  tradebook::JsonFileStateStore store(path);
  EXPECT_FALSE(store.load().has_value());
}

// -----------------------------------------------------------------------------
// 2. A saved snapshot loads back field for field.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, SaveThenLoadReturnsSameSnapshot) {
  tradebook::PositionLedger ledger;
  runFills(ledger, sampleSequence());
  const auto snap = ledger.snapshot();
  ASSERT_FALSE(snap.closed_trades.empty());

  tradebook::JsonFileStateStore store(path);
  store.save(snap);

  std::filesystem::path tmp = path;
  tmp += ".tmp";
  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_FALSE(std::filesystem::exists(tmp));

  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, snap);
}

// -----------------------------------------------------------------------------
// 3. Saving twice replaces the previous content.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, SaveOverwritesPreviousSnapshot) {
  tradebook::JsonFileStateStore store(path);

  tradebook::PositionLedger ledger;
  runFills(ledger, {makeFill("a", "up", Side::Buy, 10.0, 0.5, 1)});
  store.save(ledger.snapshot());

  runFills(ledger, {makeFill("b", "up", Side::Sell, 10.0, 0.6, 2)});
  store.save(ledger.snapshot());

  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->positions.empty());
  EXPECT_EQ(loaded->closed_trades.size(), 1u);
  EXPECT_EQ(loaded->cursor.seen_trade_ids.size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. Garbage on disk is a StateStoreError, never a silent empty ledger.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, MalformedFileThrows) {
  writeRaw("{ not json");
  tradebook::JsonFileStateStore store(path);
  EXPECT_THROW(store.load(), tradebook::StateStoreError);
}

TEST_F(StateStoreTest, MissingRequiredFieldThrows) {
  writeRaw(R"({"version":1,"positions":[{"token_id":"up"}],"closed_trades":[]})");
  tradebook::JsonFileStateStore store(path);
  EXPECT_THROW(store.load(), tradebook::StateStoreError);
}

TEST_F(StateStoreTest, UnknownClassificationThrows) {
  writeRaw(R"({"version":1,"positions":[],"closed_trades":[
      {"trade_id":"t","market_id":"m","token_id":"x","kind":"SIDEWAYS",
       "closing_size":1,"entry_price":0.5,"exit_price":0.6,
       "realized_pnl":0.1}]})");
  tradebook::JsonFileStateStore store(path);
  EXPECT_THROW(store.load(), tradebook::StateStoreError);
}

TEST_F(StateStoreTest, UnsupportedVersionThrows) {
  writeRaw(R"({"version":99,"positions":[],"closed_trades":[]})");
  tradebook::JsonFileStateStore store(path);
  EXPECT_THROW(store.load(), tradebook::StateStoreError);
}

// -----------------------------------------------------------------------------
// 5. Snapshot JSON uses readable classification names.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, SnapshotJsonUsesClassificationNames) {
  tradebook::PositionLedger ledger;
  runFills(ledger, {makeFill("a", "up", Side::Buy, 10.0, 0.5, 1),
                    makeFill("b", "up", Side::Sell, 4.0, 0.6, 2)});

  nlohmann::json j = ledger.snapshot();
  EXPECT_EQ(j.at("version").get<int>(), tradebook::kSnapshotVersion);
  ASSERT_EQ(j.at("closed_trades").size(), 1u);
  EXPECT_EQ(j.at("closed_trades")[0].at("kind").get<std::string>(),
            "PARTIAL_CLOSE");
}

// -----------------------------------------------------------------------------
// 6. Resumption from every prefix reproduces the uninterrupted final state.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, ResumingFromAnyPrefixReproducesFinalState) {
  const auto fills = sampleSequence();

  tradebook::PositionLedger reference;
  runFills(reference, fills);
  const auto expected = reference.snapshot();

  for (std::size_t cut = 0; cut <= fills.size(); ++cut) {
    SCOPED_TRACE("prefix length " + std::to_string(cut));

    std::vector<TradeEvent> head(fills.begin(), fills.begin() + cut);
    std::vector<TradeEvent> tail(fills.begin() + cut, fills.end());

    tradebook::JsonFileStateStore store(path);
    {
      tradebook::PositionLedger first;
      runFills(first, head);
      store.save(first.snapshot());
    }

    tradebook::PositionLedger resumed;
    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    resumed.restore(*loaded);
    runFills(resumed, tail);

    EXPECT_EQ(resumed.snapshot(), expected);
    EXPECT_DOUBLE_EQ(resumed.cumulativeRealizedPnl(),
                     reference.cumulativeRealizedPnl());
  }
}

// -----------------------------------------------------------------------------
// 7. Replaying the whole sequence after resumption changes nothing: every
//    fill is already in the seen-id cursor.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, RedeliveredFillsAfterResumeAreSkipped) {
  const auto fills = sampleSequence();

  tradebook::JsonFileStateStore store(path);
  tradebook::PositionLedger first;
  runFills(first, fills, &store);

  tradebook::PositionLedger resumed;
  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  resumed.restore(*loaded);
  runFills(resumed, fills);

  EXPECT_EQ(resumed.snapshot(), first.snapshot());
}
