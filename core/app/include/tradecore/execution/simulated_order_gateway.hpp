#pragma once

#include "tradecore/concurrent/thread_safe_queue.hpp"
#include "tradecore/execution/i_order_gateway.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_set>

namespace tradecore {

// -----------------------------------------------------------------------------
// SimulatedGatewayConfig
// -----------------------------------------------------------------------------
struct SimulatedGatewayConfig {
  std::chrono::milliseconds latency{10};  // Per-request processing delay
  double reject_ratio{0.0};               // Fraction of submits refused
  bool auto_fill{true};                   // Fill accepted orders at once
  std::uint32_t seed{7};
};

// -----------------------------------------------------------------------------
// SimulatedOrderGateway: in-process venue on its own worker thread
// -----------------------------------------------------------------------------
//
// @brief  IOrderGateway that acknowledges, rejects and fills orders
//         asynchronously, used by the executable and by tests.
//
// @details
// submitOrder()/cancelOrder() package the request with a std::promise and
// push it onto a ThreadSafeQueue. The worker thread pops requests, waits
// `latency`, and fulfils the promise:
//
//   caller thread                    worker thread
//   ─────────────                    ─────────────
//   submitOrder(order) ──push()──▶  pop_for()
//   ◀── future                       sleep(latency)
//                                    reject_ratio draw
//                                    promise.set_value(ack)
//                                    [auto_fill] handler(Filled report)
//
// Fills are reported at the order's limit price when it has one, otherwise
// at its reference price. With auto_fill disabled, accepted orders stay
// "live" at the venue and can be cancelled.
//
// Shutdown:
//   stop() joins the worker, then fails every request still queued with
//   "gateway stopped". Requests made while stopped fail immediately.
//
// Thread model:
//   All public methods are safe from any thread. The report handler is
//   invoked on the worker while handler_mutex_ is held, which is what lets
//   setExecutionReportHandler({}) guarantee the previous handler has
//   finished.
// -----------------------------------------------------------------------------
class SimulatedOrderGateway final : public IOrderGateway {
 public:
  explicit SimulatedOrderGateway(const ITimeProvider& time_provider,
                                 SimulatedGatewayConfig config = {});

  ~SimulatedOrderGateway() override;

  SimulatedOrderGateway(const SimulatedOrderGateway&) = delete;
  SimulatedOrderGateway& operator=(const SimulatedOrderGateway&) = delete;
  SimulatedOrderGateway(SimulatedOrderGateway&&) = delete;
  SimulatedOrderGateway& operator=(SimulatedOrderGateway&&) = delete;

  // Idempotent.
  void start();
  void stop();
  bool isRunning() const { return running_.load(); }

  std::future<GatewayAck> submitOrder(const domain::Order& order) override;
  std::future<GatewayAck> cancelOrder(domain::OrderId order_id) override;
  void setExecutionReportHandler(ExecutionReportHandler handler) override;

  // Calls received, including those refused because the gateway was stopped.
  std::uint64_t submitCount() const { return submit_count_.load(); }
  std::uint64_t cancelCount() const { return cancel_count_.load(); }

 private:
  struct Request {
    enum class Kind { Submit, Cancel } kind{Kind::Submit};
    domain::Order order;
    domain::OrderId cancel_id{};
    std::promise<GatewayAck> promise;
  };

  std::future<GatewayAck> enqueue(Request request);
  void run();
  void process(Request& request);
  void emitReport(const ExecutionReport& report);

  const ITimeProvider& time_provider_;
  const SimulatedGatewayConfig config_;

  ThreadSafeQueue<Request> queue_;
  std::mutex lifecycle_mutex_;  // Orders enqueue() against stop()
  std::atomic<bool> running_{false};
  std::thread worker_;

  // Worker-thread only.
  std::mt19937 rng_;
  std::unordered_set<domain::OrderId> live_orders_;

  std::mutex handler_mutex_;
  ExecutionReportHandler handler_;

  std::atomic<std::uint64_t> submit_count_{0};
  std::atomic<std::uint64_t> cancel_count_{0};
};

}  // namespace tradecore
