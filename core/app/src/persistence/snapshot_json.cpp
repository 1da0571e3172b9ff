#include "tradebook/persistence/snapshot_json.hpp"

#include <stdexcept>

namespace tradebook {
namespace domain {

void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"token_id", p.token_id},
                     {"market_id", p.market_id},
                     {"outcome", p.outcome},
                     {"size", p.size},
                     {"entry_price", p.entry_price},
                     {"direction", p.direction},
                     {"opened_at_ms", p.opened_at_ms},
                     {"updated_at_ms", p.updated_at_ms}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("token_id").get_to(p.token_id);
  j.at("market_id").get_to(p.market_id);
  j.at("outcome").get_to(p.outcome);
  j.at("size").get_to(p.size);
  j.at("entry_price").get_to(p.entry_price);
  j.at("direction").get_to(p.direction);
  p.opened_at_ms = j.value("opened_at_ms", std::int64_t{0});
  p.updated_at_ms = j.value("updated_at_ms", p.opened_at_ms);
}

void to_json(nlohmann::json& j, const ClosedTradeRecord& r) {
  j = nlohmann::json{{"trade_id", r.trade_id},
                     {"market_id", r.market_id},
                     {"token_id", r.token_id},
                     {"outcome", r.outcome},
                     {"kind", classificationToString(r.kind)},
                     {"closing_size", r.closing_size},
                     {"entry_price", r.entry_price},
                     {"exit_price", r.exit_price},
                     {"realized_pnl", r.realized_pnl},
                     {"timestamp_ms", r.timestamp_ms}};
}

void from_json(const nlohmann::json& j, ClosedTradeRecord& r) {
  r.trade_id = j.value("trade_id", std::string{});
  j.at("market_id").get_to(r.market_id);
  j.at("token_id").get_to(r.token_id);
  r.outcome = j.value("outcome", std::string{});
  r.kind = classificationFromString(j.at("kind").get<std::string>());
  j.at("closing_size").get_to(r.closing_size);
  j.at("entry_price").get_to(r.entry_price);
  j.at("exit_price").get_to(r.exit_price);
  j.at("realized_pnl").get_to(r.realized_pnl);
  r.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
}

TradeClassification classificationFromString(const std::string& name) {
  using C = TradeClassification;
  for (C c : {C::Open, C::Increase, C::PartialClose, C::FullClose, C::Reverse,
              C::HedgeClose, C::PartialHedge}) {
    if (name == classificationToString(c)) {
      return c;
    }
  }
  throw std::invalid_argument("unknown trade classification: " + name);
}

}  // namespace domain

void to_json(nlohmann::json& j, const FeedCursor& c) {
  j = nlohmann::json{{"last_seen_timestamp_ms", c.last_seen_timestamp_ms},
                     {"seen_trade_ids", c.seen_trade_ids}};
}

void from_json(const nlohmann::json& j, FeedCursor& c) {
  c.last_seen_timestamp_ms = j.value("last_seen_timestamp_ms", std::int64_t{0});
  c.seen_trade_ids.clear();
  if (j.contains("seen_trade_ids")) {
    j.at("seen_trade_ids").get_to(c.seen_trade_ids);
  }
}

void to_json(nlohmann::json& j, const LedgerSnapshot& s) {
  j = nlohmann::json{{"version", kSnapshotVersion},
                     {"positions", s.positions},
                     {"closed_trades", s.closed_trades},
                     {"cursor", s.cursor}};
}

void from_json(const nlohmann::json& j, LedgerSnapshot& s) {
  const int version = j.value("version", kSnapshotVersion);
  if (version != kSnapshotVersion) {
    throw std::invalid_argument("unsupported snapshot version " +
                                std::to_string(version));
  }
  j.at("positions").get_to(s.positions);
  j.at("closed_trades").get_to(s.closed_trades);
  if (j.contains("cursor")) {
    j.at("cursor").get_to(s.cursor);
  } else {
    s.cursor = FeedCursor{};
  }
}

}  // namespace tradebook
