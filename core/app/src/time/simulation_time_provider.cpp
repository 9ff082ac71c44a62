#include "tradecore/time/simulation_time_provider.hpp"

namespace tradecore {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::set_time(std::int64_t ms) {
  current_time_ms_.store(ms);
}

// fetch_add returns the previous value; add delta once more for the result.
std::int64_t SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  return current_time_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace tradecore
