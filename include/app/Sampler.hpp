#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include "collectors/CpuCollector.hpp"
#include "collectors/IPowerBackend.hpp"
#include "collectors/MemoryCollector.hpp"
#include "model/Record.hpp"

namespace wattrec::app {

enum class SamplerState { Init, Running, Stopping, Done };

struct SamplerOptions {
  std::chrono::milliseconds interval{1000};
  uint64_t max_ticks{0}; // 0 => until stop is requested
  bool verbose{false};
};

// The recording loop. Each tick waits one interval, then reads CPU%
// (measured over that interval), used memory and the power backend.
// A stop request cuts the interval wait short, but the tick still takes
// all three readings, so every series entry belongs to a complete tick.
class Sampler {
public:
  Sampler(std::unique_ptr<wattrec::collectors::IPowerBackend> power, SamplerOptions opts);
  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  // Blocks until 'stop' is observed or max_ticks complete. Throws
  // std::runtime_error when CPU or memory statistics cannot be read.
  const wattrec::model::RunSeries& run(const std::atomic<bool>& stop);

  [[nodiscard]] SamplerState state() const { return state_; }
  [[nodiscard]] const wattrec::model::RunSeries& series() const { return series_; }
  [[nodiscard]] const wattrec::collectors::IPowerBackend& power() const { return *power_; }

private:
  void tick(const std::atomic<bool>& stop);

  std::unique_ptr<wattrec::collectors::IPowerBackend> power_;
  SamplerOptions opts_;
  wattrec::collectors::CpuCollector cpu_{};
  wattrec::collectors::MemoryCollector mem_{};
  wattrec::model::RunSeries series_{};
  SamplerState state_{SamplerState::Init};
};

} // namespace wattrec::app
