#pragma once
#include "model/Cpu.hpp"

namespace wattrec::collectors {

// Aggregate CPU utilization from successive counter snapshots. The first
// successful sample only primes the baseline and reports 0%.
class CpuCollector {
public:
  CpuCollector() = default;
  bool sample(wattrec::model::CpuSample& out);
private:
  bool read_times(wattrec::model::CpuTimes& agg);
  wattrec::model::CpuTimes last_total_{};
  bool has_last_{false};
};

} // namespace wattrec::collectors
