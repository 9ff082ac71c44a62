// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for tradecore::EventBus, the Orchestrator's notification fan-out.
//
// Validates:
//   - Generic subscription sees every event type
//   - Typed subscription filters by event type
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback
//   - A throwing subscriber does not stop delivery to the others
//   - Payloads arrive intact through the variant dispatch
//
// Single-threaded: cross-thread publishing is covered by orchestrator_test.
// =============================================================================

#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/events/event.hpp"
#include "tradecore/events/event_types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace {

tradecore::SignalEvent makeSignal(const std::string& symbol,
                                  tradecore::domain::Side side) {
  tradecore::SignalEvent e;
  e.signal.strategy = "MomentumStrategy";
  e.signal.symbol = symbol;
  e.signal.side = side;
  e.signal.confidence = 0.5;
  e.signal.target_price = 101.25;
  e.signal.quantity = 100.0;
  return e;
}

tradecore::OrderFailedEvent makeFailure(const std::string& reason) {
  tradecore::OrderFailedEvent e;
  e.order.id = 7;
  e.order.symbol = "BTC/USD";
  e.reason = reason;
  return e;
}

}  // namespace

class EventBusTest : public ::testing::Test {
 protected:
  tradecore::EventBus bus;
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const tradecore::Event&) { ++calls; });

  bus.publish(makeSignal("BTC/USD", tradecore::domain::Side::Buy));
  bus.publish(makeFailure("timeout"));
  bus.publish(tradecore::LoopFaultEvent{"DecisionLoop", "boom", {}});

  EXPECT_EQ(calls, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its own event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByType) {
  int signals = 0;
  int failures = 0;
  bus.subscribe<tradecore::SignalEvent>(
      [&signals](const tradecore::SignalEvent&) { ++signals; });
  bus.subscribe<tradecore::OrderFailedEvent>(
      [&failures](const tradecore::OrderFailedEvent&) { ++failures; });

  bus.publish(makeSignal("BTC/USD", tradecore::domain::Side::Buy));
  bus.publish(makeSignal("ETH/USD", tradecore::domain::Side::Sell));
  bus.publish(makeFailure("timeout"));

  EXPECT_EQ(signals, 2);
  EXPECT_EQ(failures, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id) the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<tradecore::SignalEvent>(
      [&calls](const tradecore::SignalEvent&) { ++calls; });

  bus.publish(makeSignal("BTC/USD", tradecore::domain::Side::Buy));
  EXPECT_EQ(calls, 1);

  bus.unsubscribe(id);
  bus.publish(makeSignal("BTC/USD", tradecore::domain::Side::Buy));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Unsubscribing an unknown id and publishing to an empty bus are no-ops.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnknownIdAndEmptyBusAreHarmless) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
  EXPECT_NO_THROW(bus.publish(makeFailure("timeout")));
}

// -----------------------------------------------------------------------------
// 5. Re-entrant publish from inside a callback does not deadlock.
// Why: publish() copies the subscriber list and releases the lock before
//      invoking callbacks.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int failures_seen = 0;
  bus.subscribe<tradecore::OrderFailedEvent>(
      [&failures_seen](const tradecore::OrderFailedEvent&) {
        ++failures_seen;
      });
  bus.subscribe<tradecore::SignalEvent>(
      [this](const tradecore::SignalEvent&) {
        bus.publish(makeFailure("rejected by gateway"));
      });

  bus.publish(makeSignal("BTC/USD", tradecore::domain::Side::Buy));

  EXPECT_EQ(failures_seen, 1);
}

// -----------------------------------------------------------------------------
// 6. A subscriber that throws is logged and skipped; later subscribers still
//    receive the event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotBlockOthers) {
  int delivered = 0;
  bus.subscribe<tradecore::SignalEvent>([](const tradecore::SignalEvent&) {
    throw std::runtime_error("subscriber failure");
  });
  bus.subscribe<tradecore::SignalEvent>(
      [&delivered](const tradecore::SignalEvent&) { ++delivered; });

  EXPECT_NO_THROW(
      bus.publish(makeSignal("BTC/USD", tradecore::domain::Side::Buy)));
  EXPECT_EQ(delivered, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values survive publish → dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  tradecore::domain::TradingSignal received;
  bus.subscribe<tradecore::SignalEvent>(
      [&received](const tradecore::SignalEvent& e) { received = e.signal; });

  bus.publish(makeSignal("SOL/USDT", tradecore::domain::Side::Sell));

  EXPECT_EQ(received.symbol, "SOL/USDT");
  EXPECT_EQ(received.side, tradecore::domain::Side::Sell);
  EXPECT_EQ(received.strategy, "MomentumStrategy");
  EXPECT_DOUBLE_EQ(received.target_price, 101.25);
  EXPECT_DOUBLE_EQ(received.quantity, 100.0);
}
