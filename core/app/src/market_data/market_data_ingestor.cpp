#include "tradecore/market_data/market_data_ingestor.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradecore {

MarketDataIngestor::MarketDataIngestor(
    std::string symbol, std::shared_ptr<IMarketDataSource> source,
    std::shared_ptr<PriceHistoryStore> history,
    std::chrono::milliseconds interval, RunFlag run_flag)
    : symbol_(std::move(symbol)),
      source_(std::move(source)),
      history_(std::move(history)),
      loop_("MarketDataIngestor:" + symbol_, interval,
            [this] { pollOnce(); }, std::move(run_flag)) {
  if (symbol_.empty()) {
    throw std::invalid_argument("MarketDataIngestor requires a symbol");
  }
  if (!source_ || !history_) {
    throw std::invalid_argument(
        "MarketDataIngestor requires a source and a history store");
  }
}

MarketDataIngestor::~MarketDataIngestor() { stop(); }

void MarketDataIngestor::start() { loop_.start(); }

void MarketDataIngestor::stop() { loop_.stop(); }

void MarketDataIngestor::setFaultHandler(
    PollingLoopThread::FaultHandler handler) {
  loop_.setFaultHandler(std::move(handler));
}

// -----------------------------------------------------------------------------
// pollOnce(): fetch, validate, record
// -----------------------------------------------------------------------------
void MarketDataIngestor::pollOnce() {
  std::optional<domain::PriceSample> sample = source_->getPrice(symbol_);
  if (!sample) {
    gaps_.fetch_add(1);
    return;
  }

  const bool valid = sample->symbol == symbol_ &&
                     std::isfinite(sample->price) && sample->price > 0.0 &&
                     std::isfinite(sample->volume) && sample->volume >= 0.0;
  if (!valid) {
    dropped_.fetch_add(1);
    std::cerr << "[MarketDataIngestor] " << symbol_
              << ": dropping invalid sample (symbol=" << sample->symbol
              << " price=" << sample->price << " volume=" << sample->volume
              << ")\n";
    return;
  }

  history_->record(symbol_, std::move(*sample));
  recorded_.fetch_add(1);
}

}  // namespace tradecore
