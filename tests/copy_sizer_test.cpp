// =============================================================================
// copy_sizer_test.cpp
// =============================================================================
// Unit tests for tradebook::CopySizer.
//
// Validates:
//   - shouldCopy() filters fills that cannot be mirrored
//   - computeSize() applies the risk multiplier
//   - The USDC notional cap, and disabling it with max_trade_usdc <= 0
//   - apply() changes only the size
// =============================================================================

#include "tradebook/sizing/copy_sizer.hpp"

#include <gtest/gtest.h>

namespace {

tradebook::domain::TradeEvent makeFill(double size, double price) {
  tradebook::domain::TradeEvent e;
  e.trade_id = "t1";
  e.token_id = "tok";
  e.market_id = "m1";
  e.outcome = "Yes";
  e.side = tradebook::domain::Side::Buy;
  e.size = size;
  e.price = price;
  e.timestamp_ms = 42;
  return e;
}

tradebook::SizingConfig makeConfig(double multiplier, double cap) {
  tradebook::SizingConfig cfg;
  cfg.enabled = true;
  cfg.risk_multiplier = multiplier;
  cfg.max_trade_usdc = cap;
  return cfg;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Fills without a positive size/price or without ids are not copied.
// -----------------------------------------------------------------------------
TEST(CopySizerTest, ShouldCopyFiltersUnusableFills) {
  tradebook::CopySizer sizer;

  EXPECT_TRUE(sizer.shouldCopy(makeFill(10.0, 0.5)));
  EXPECT_FALSE(sizer.shouldCopy(makeFill(0.0, 0.5)));
  EXPECT_FALSE(sizer.shouldCopy(makeFill(10.0, 0.0)));

  auto no_market = makeFill(10.0, 0.5);
  no_market.market_id.clear();
  EXPECT_FALSE(sizer.shouldCopy(no_market));

  auto no_token = makeFill(10.0, 0.5);
  no_token.token_id.clear();
  EXPECT_FALSE(sizer.shouldCopy(no_token));
}

// -----------------------------------------------------------------------------
// 2. Below the cap the size is multiplied.
// -----------------------------------------------------------------------------
TEST(CopySizerTest, MultiplierScalesSize) {
  tradebook::CopySizer sizer(makeConfig(0.5, 100.0));
  auto fill = makeFill(40.0, 0.5);

  EXPECT_FALSE(sizer.isCapped(fill));
  EXPECT_DOUBLE_EQ(sizer.computeSize(fill), 20.0);
}

// -----------------------------------------------------------------------------
// 3. Above the cap the size is cut so size * price == max_trade_usdc.
// -----------------------------------------------------------------------------
TEST(CopySizerTest, CapLimitsNotional) {
  tradebook::CopySizer sizer(makeConfig(2.0, 50.0));
  auto fill = makeFill(100.0, 0.5);  // 200 shares * 0.5 = 100 USDC

  EXPECT_TRUE(sizer.isCapped(fill));
  const double size = sizer.computeSize(fill);
  EXPECT_DOUBLE_EQ(size, 100.0);
  EXPECT_DOUBLE_EQ(size * fill.price, 50.0);
}

// -----------------------------------------------------------------------------
// 4. A non-positive cap disables capping.
// -----------------------------------------------------------------------------
TEST(CopySizerTest, NonPositiveCapDisablesLimit) {
  tradebook::CopySizer sizer(makeConfig(3.0, 0.0));
  auto fill = makeFill(1000.0, 0.9);

  EXPECT_FALSE(sizer.isCapped(fill));
  EXPECT_DOUBLE_EQ(sizer.computeSize(fill), 3000.0);
}

// -----------------------------------------------------------------------------
// 5. apply() keeps every other field.
// -----------------------------------------------------------------------------
TEST(CopySizerTest, ApplyOnlyChangesSize) {
  tradebook::CopySizer sizer(makeConfig(0.1, 100.0));
  auto fill = makeFill(50.0, 0.4);

  auto sized = sizer.apply(fill);

  EXPECT_DOUBLE_EQ(sized.size, 5.0);
  EXPECT_EQ(sized.trade_id, fill.trade_id);
  EXPECT_EQ(sized.token_id, fill.token_id);
  EXPECT_EQ(sized.side, fill.side);
  EXPECT_DOUBLE_EQ(sized.price, fill.price);
  EXPECT_EQ(sized.timestamp_ms, fill.timestamp_ms);
}
