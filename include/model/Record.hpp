#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace wattrec::model {

struct StatSummary {
  bool   available{false}; // false => every field renders as N/A
  double min{0.0};
  double max{0.0};
  double mean{0.0};
};

// Raw per-tick readings accumulated by the sampler.
struct RunSeries {
  std::vector<double> cpu_pct;
  std::vector<double> ram_mb;
  std::vector<double> watts;
  double energy_j{0.0};    // sum of watts x tick duration over recorded ticks
  uint64_t ticks{0};
};

struct RunRecord {
  std::string start_ts;    // YYYY-MM-DD_HH-MM-SS (UTC)
  std::string end_ts;
  long long   elapsed_s{0};
  std::string os_label;    // e.g. "Linux 6.8.0"
  std::string power_source;
  StatSummary cpu;
  StatSummary ram;
  StatSummary watts;
  bool   has_energy{false};
  double energy_wh{0.0};
};

} // namespace wattrec::model
