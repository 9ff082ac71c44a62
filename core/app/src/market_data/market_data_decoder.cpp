#include "tradecore/market_data/market_data_decoder.hpp"

#include "tradecore/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace tradecore {

namespace {

using json = nlohmann::json;

std::string requireSymbol(const json& msg) {
  std::string symbol = msg.at("symbol").get<std::string>();
  if (symbol.empty()) {
    throw MarketDataDecodeError("empty symbol");
  }
  return symbol;
}

std::vector<domain::PriceLevel> decodeLevels(const json& side,
                                             const char* name) {
  if (!side.is_array()) {
    throw MarketDataDecodeError(std::string(name) + " must be an array");
  }
  std::vector<domain::PriceLevel> levels;
  levels.reserve(side.size());
  for (const auto& level : side) {
    if (!level.is_array() || level.size() != 2) {
      throw MarketDataDecodeError(std::string(name) +
                                  " levels must be [price, quantity] pairs");
    }
    domain::PriceLevel parsed{level.at(0).get<double>(),
                              level.at(1).get<double>()};
    if (parsed.price <= 0.0 || parsed.quantity < 0.0) {
      throw MarketDataDecodeError(std::string(name) +
                                  " level has a non-positive price or "
                                  "negative quantity");
    }
    levels.push_back(parsed);
  }
  return levels;
}

domain::PriceSample decodePrice(const json& msg) {
  domain::PriceSample sample;
  sample.symbol = requireSymbol(msg);
  sample.price = msg.at("price").get<double>();
  sample.volume = msg.value("volume", 0.0);
  sample.timestamp =
      ms_to_timestamp(msg.at("timestamp_ms").get<std::int64_t>());
  if (sample.price <= 0.0) {
    throw MarketDataDecodeError("price must be positive");
  }
  return sample;
}

domain::OrderBookSnapshot decodeBook(const json& msg) {
  domain::OrderBookSnapshot book;
  book.symbol = requireSymbol(msg);
  book.bids = decodeLevels(msg.at("bids"), "bids");
  book.asks = decodeLevels(msg.at("asks"), "asks");
  book.timestamp =
      ms_to_timestamp(msg.at("timestamp_ms").get<std::int64_t>());

  std::sort(book.bids.begin(), book.bids.end(),
            [](const domain::PriceLevel& a, const domain::PriceLevel& b) {
              return a.price > b.price;
            });
  std::sort(book.asks.begin(), book.asks.end(),
            [](const domain::PriceLevel& a, const domain::PriceLevel& b) {
              return a.price < b.price;
            });
  return book;
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeMarketDataMessage: nlohmann errors are rethrown as decode errors
// -----------------------------------------------------------------------------
MarketDataMessage decodeMarketDataMessage(const std::string& payload) {
  try {
    const json msg = json::parse(payload);
    if (!msg.is_object()) {
      throw MarketDataDecodeError("message must be a JSON object");
    }

    const std::string type = msg.value("type", std::string("price"));
    if (type == "price") {
      return decodePrice(msg);
    }
    if (type == "book") {
      return decodeBook(msg);
    }
    throw MarketDataDecodeError("unknown message type '" + type + "'");
  } catch (const json::exception& e) {
    throw MarketDataDecodeError(e.what());
  }
}

}  // namespace tradecore
