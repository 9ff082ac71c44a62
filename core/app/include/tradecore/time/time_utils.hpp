#pragma once

#include <chrono>
#include <cstdint>

namespace tradecore {

// Wall-clock instant carried by samples, order books and orders.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// ms_to_timestamp / timestamp_to_ms
// -----------------------------------------------------------------------------
// Bridge between ITimeProvider's epoch milliseconds (also the unit of the
// ZeroMQ tick feed) and Timestamp. Millisecond resolution: sub-millisecond
// parts of a Timestamp are truncated by timestamp_to_ms().
// -----------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace tradecore
