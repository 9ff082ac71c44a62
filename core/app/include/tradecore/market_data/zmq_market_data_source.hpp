#pragma once

#include "tradecore/market_data/i_market_data_source.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace tradecore {

// -----------------------------------------------------------------------------
// ZmqMarketDataSource: ZeroMQ SUB feed behind IMarketDataSource
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks and book snapshots from an external publisher
//         and serves the latest ones to the engine's pull-based loops.
//
// @details
// An external process (a market data bridge, a replay script) PUBlishes JSON
// messages in the format documented in market_data_decoder.hpp. A dedicated
// receive thread decodes each message and stores it:
//
//   price tick  → latest_prices_[symbol]   (conflated; newer replaces older)
//   book        → latest_books_[symbol]
//
// getPrice() consumes the latest tick, so an ingestor never records the
// same tick twice and a quiet symbol reads as "no data this tick".
// getOrderBook() returns the latest book without consuming it. A symbol
// that has traded but never had a book message gets an empty-sided snapshot
// so strategies still run; a symbol never seen at all gets std::nullopt.
//
// Shutdown:
//   The SUB socket has ZMQ_RCVTIMEO set, so recv() returns at least every
//   kRecvTimeoutMs and the thread notices stop() promptly.
//
// Malformed messages are logged to std::cerr and counted, never fatal. A
// failing recv() ends the receive thread: healthy() turns false and
// failureReason() keeps the ZeroMQ error until the next start().
//
// Ownership:
//   Owns the zmq context, socket and receive thread.
// -----------------------------------------------------------------------------
class ZmqMarketDataSource final : public IMarketDataSource {
 public:
  // Connects (asynchronously, per ZeroMQ semantics) to `endpoint` and
  // subscribes to every topic. Throws zmq::error_t on an invalid endpoint.
  explicit ZmqMarketDataSource(const std::string& endpoint);

  ~ZmqMarketDataSource() override;

  ZmqMarketDataSource(const ZmqMarketDataSource&) = delete;
  ZmqMarketDataSource& operator=(const ZmqMarketDataSource&) = delete;
  ZmqMarketDataSource(ZmqMarketDataSource&&) = delete;
  ZmqMarketDataSource& operator=(ZmqMarketDataSource&&) = delete;

  // Starts the receive thread. Idempotent.
  void start();

  // Stops and joins the receive thread. Idempotent.
  void stop();

  std::optional<domain::PriceSample> getPrice(
      const std::string& symbol) override;

  std::optional<domain::OrderBookSnapshot> getOrderBook(
      const std::string& symbol) override;

  // False once the receive thread has died on a socket error.
  bool healthy() const override { return !failed_.load(); }
  std::string failureReason() const;

  std::uint64_t messagesReceived() const { return received_.load(); }
  std::uint64_t decodeErrors() const { return decode_errors_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();
  void handlePayload(const std::string& payload);
  void fail(const std::string& reason);

  const std::string endpoint_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};
  std::thread thread_;

  mutable std::mutex mutex_;
  std::string failure_reason_;
  std::unordered_map<std::string, domain::PriceSample> latest_prices_;
  std::unordered_map<std::string, domain::OrderBookSnapshot> latest_books_;
  std::unordered_map<std::string, Timestamp> last_seen_;

  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
};

}  // namespace tradecore
