#include "tradebook/sizing/copy_sizer.hpp"

namespace tradebook {

CopySizer::CopySizer(SizingConfig config) : config_(config) {}

bool CopySizer::shouldCopy(const domain::TradeEvent& fill) const {
  if (fill.size <= 0.0 || fill.price <= 0.0) {
    return false;
  }
  return !fill.market_id.empty() && !fill.token_id.empty();
}

double CopySizer::computeSize(const domain::TradeEvent& fill) const {
  const double desired = fill.size * config_.risk_multiplier;
  if (isCapped(fill)) {
    return config_.max_trade_usdc / fill.price;
  }
  return desired;
}

bool CopySizer::isCapped(const domain::TradeEvent& fill) const {
  if (config_.max_trade_usdc <= 0.0 || fill.price <= 0.0) {
    return false;
  }
  const double desired = fill.size * config_.risk_multiplier;
  return desired * fill.price > config_.max_trade_usdc;
}

domain::TradeEvent CopySizer::apply(const domain::TradeEvent& fill) const {
  domain::TradeEvent sized = fill;
  sized.size = computeSize(fill);
  return sized;
}

}  // namespace tradebook
