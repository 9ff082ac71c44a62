#include "tradecore/market_data/zmq_market_data_source.hpp"

#include "tradecore/market_data/market_data_decoder.hpp"

#include <iostream>
#include <type_traits>
#include <utility>

namespace tradecore {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout, connected to the publisher
// -----------------------------------------------------------------------------
ZmqMarketDataSource::ZmqMarketDataSource(const std::string& endpoint)
    : endpoint_(endpoint) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint_);
}

ZmqMarketDataSource::~ZmqMarketDataSource() { stop(); }

void ZmqMarketDataSource::start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    failure_reason_.clear();
  }
  failed_.store(false);
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[ZmqMarketDataSource] listening on " << endpoint_ << "\n";
}

std::string ZmqMarketDataSource::failureReason() const {
  std::lock_guard lock(mutex_);
  return failure_reason_;
}

void ZmqMarketDataSource::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[ZmqMarketDataSource] stopped after " << received_.load()
              << " messages (" << decode_errors_.load()
              << " malformed).\n";
  }
}

// -----------------------------------------------------------------------------
// getPrice(): consume the latest conflated tick
// -----------------------------------------------------------------------------
std::optional<domain::PriceSample> ZmqMarketDataSource::getPrice(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = latest_prices_.find(symbol);
  if (it == latest_prices_.end()) {
    return std::nullopt;
  }
  domain::PriceSample sample = std::move(it->second);
  latest_prices_.erase(it);
  return sample;
}

std::optional<domain::OrderBookSnapshot> ZmqMarketDataSource::getOrderBook(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto book_it = latest_books_.find(symbol);
  if (book_it != latest_books_.end()) {
    return book_it->second;
  }

  auto seen_it = last_seen_.find(symbol);
  if (seen_it == last_seen_.end()) {
    return std::nullopt;
  }
  domain::OrderBookSnapshot empty;
  empty.symbol = symbol;
  empty.timestamp = seen_it->second;
  return empty;
}

// -----------------------------------------------------------------------------
// run(): recv loop, bounded by ZMQ_RCVTIMEO
// -----------------------------------------------------------------------------
void ZmqMarketDataSource::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      fail(std::string("recv failed: ") + e.what());
      return;
    }

    if (!result.has_value()) {
      continue;
    }

    received_.fetch_add(1);
    handlePayload(msg.to_string());
  }
}

void ZmqMarketDataSource::fail(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    failure_reason_ = reason;
  }
  failed_.store(true);
  std::cerr << "[ZmqMarketDataSource] " << reason
            << ". Receive thread exiting; feed unhealthy.\n";
}

void ZmqMarketDataSource::handlePayload(const std::string& payload) {
  MarketDataMessage decoded;
  try {
    decoded = decodeMarketDataMessage(payload);
  } catch (const MarketDataDecodeError& e) {
    decode_errors_.fetch_add(1);
    std::cerr << "[ZmqMarketDataSource] dropping malformed message: "
              << e.what() << " (payload: " << payload << ")\n";
    return;
  }

  std::lock_guard lock(mutex_);
  std::visit(
      [this](auto&& value) {
        using T = std::decay_t<decltype(value)>;
        const std::string symbol = value.symbol;
        last_seen_[symbol] = value.timestamp;
        if constexpr (std::is_same_v<T, domain::PriceSample>) {
          latest_prices_[symbol] = std::move(value);
        } else {
          latest_books_[symbol] = std::move(value);
        }
      },
      std::move(decoded));
}

}  // namespace tradecore
