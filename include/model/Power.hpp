#pragma once
#include <cstdint>
#include <optional>

namespace wattrec::model {

// Carry-over for the energy-counter backend. Owned by exactly one backend.
struct RaplState {
  bool     primed{false};
  uint64_t energy_uj{};  // summed package counters at the previous call
  double   time_s{};     // monotonic seconds at the previous call
};

// Battery facts as reported by the platform. Missing fields stay empty.
struct BatteryStatus {
  bool present{false};
  bool plugged{false};
  std::optional<double> percent;           // 0..100
  std::optional<double> seconds_left;      // time to empty
  std::optional<double> full_capacity_wh;  // last full charge capacity
};

} // namespace wattrec::model
