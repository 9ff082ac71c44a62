#include "tradecore/history/price_history_store.hpp"

#include <mutex>
#include <stdexcept>

namespace tradecore {

PriceHistoryStore::PriceHistoryStore(std::size_t capacity)
    : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument(
        "PriceHistoryStore capacity must be at least 1");
  }
}

// -----------------------------------------------------------------------------
// record: append + FIFO trim under the exclusive lock
// -----------------------------------------------------------------------------
void PriceHistoryStore::record(const std::string& symbol,
                               domain::PriceSample sample) {
  std::unique_lock lock(mutex_);
  auto& window = history_[symbol];
  window.push_back(std::move(sample));
  while (window.size() > capacity_) {
    window.pop_front();
  }
}

// -----------------------------------------------------------------------------
// snapshot: copy-out under the shared lock
// -----------------------------------------------------------------------------
std::vector<domain::PriceSample> PriceHistoryStore::snapshot(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(symbol);
  if (it == history_.end()) {
    return {};
  }
  return std::vector<domain::PriceSample>(it->second.begin(),
                                          it->second.end());
}

std::size_t PriceHistoryStore::size(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(symbol);
  return (it != history_.end()) ? it->second.size() : 0;
}

std::vector<std::string> PriceHistoryStore::symbols() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> result;
  result.reserve(history_.size());
  for (const auto& [symbol, window] : history_) {
    result.push_back(symbol);
  }
  return result;
}

}  // namespace tradecore
