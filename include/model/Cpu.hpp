#pragma once
#include <cstdint>

namespace wattrec::model {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct CpuSample {
  double usage_pct{}; // aggregate percent 0..100 since the previous sample
};

} // namespace wattrec::model
