#include "app/Sampler.hpp"
#include "collectors/NullPowerBackend.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <thread>
#include <utility>

namespace wattrec::app {

Sampler::Sampler(std::unique_ptr<wattrec::collectors::IPowerBackend> power, SamplerOptions opts)
    : power_(std::move(power)), opts_(opts) {
  if (!power_) power_ = std::make_unique<wattrec::collectors::NullPowerBackend>();
}

const wattrec::model::RunSeries& Sampler::run(const std::atomic<bool>& stop) {
  if (state_ != SamplerState::Init) return series_;

  // Baseline for the first tick's CPU delta
  wattrec::model::CpuSample primer{};
  if (!cpu_.sample(primer)) throw std::runtime_error("cannot read CPU statistics");

  state_ = SamplerState::Running;
  while (state_ == SamplerState::Running) {
    if (stop.load()) { state_ = SamplerState::Stopping; break; }
    tick(stop);
    if (opts_.max_ticks > 0 && series_.ticks >= opts_.max_ticks) state_ = SamplerState::Stopping;
  }
  // Stopping: nothing left to flush, the series are final
  state_ = SamplerState::Done;
  return series_;
}

// Sleeps out the interval in short slices so a stop request does not wait
// for a long interval to elapse.
static void wait_interval(std::chrono::milliseconds interval, const std::atomic<bool>& stop) {
  constexpr auto kSlice = std::chrono::milliseconds(50);
  const auto deadline = std::chrono::steady_clock::now() + interval;
  while (!stop.load()) {
    auto left = deadline - std::chrono::steady_clock::now();
    if (left <= std::chrono::steady_clock::duration::zero()) break;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, kSlice));
  }
}

void Sampler::tick(const std::atomic<bool>& stop) {
  auto t0 = std::chrono::steady_clock::now();
  wait_interval(opts_.interval, stop);

  wattrec::model::CpuSample cpu{};
  if (!cpu_.sample(cpu)) throw std::runtime_error("cannot read CPU statistics");
  wattrec::model::Memory mem{};
  if (!mem_.sample(mem)) throw std::runtime_error("cannot read memory statistics");
  auto watts = power_->sample();
  double dt = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  if (watts) {
    series_.watts.push_back(*watts);
    series_.energy_j += *watts * dt;
  }
  series_.cpu_pct.push_back(cpu.usage_pct);
  series_.ram_mb.push_back(mem.used_mb());
  ++series_.ticks;

  if (opts_.verbose) {
    if (watts) {
      std::fprintf(stderr, "wattrec: tick %llu: cpu %.1f%% ram %.1f MB power %.2f W\n",
                   static_cast<unsigned long long>(series_.ticks), cpu.usage_pct, mem.used_mb(), *watts);
    } else {
      std::fprintf(stderr, "wattrec: tick %llu: cpu %.1f%% ram %.1f MB power n/a\n",
                   static_cast<unsigned long long>(series_.ticks), cpu.usage_pct, mem.used_mb());
    }
  }
}

} // namespace wattrec::app
