#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include "collectors/IPowerBackend.hpp"
#include "model/Power.hpp"

namespace wattrec::collectors {

// Average package power from the powercap energy counters
// (/sys/class/powercap/intel-rapl:N/energy_uj, microjoules), differenced
// between consecutive calls. The first call only primes the state.
class RaplPowerBackend final : public IPowerBackend {
public:
  using Clock = std::function<double()>; // monotonic seconds

  explicit RaplPowerBackend(wattrec::model::RaplState state = {}, Clock clock = {});

  [[nodiscard]] std::optional<double> sample() noexcept override;
  [[nodiscard]] const char* name() const override { return "rapl"; }

  [[nodiscard]] const wattrec::model::RaplState& state() const { return state_; }

  // Sum of energy_uj over top-level package domains; nullopt when none is
  // readable or the sum is zero. 'domains' receives the number read.
  static std::optional<uint64_t> read_energy_uj(std::size_t* domains = nullptr);

  // Watts between a primed state and a new reading, clamped at zero.
  static double watts_between(const wattrec::model::RaplState& prev, uint64_t energy_uj, double time_s);

private:
  wattrec::model::RaplState state_;
  Clock clock_;
};

} // namespace wattrec::collectors
