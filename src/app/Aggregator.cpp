#include "app/Aggregator.hpp"
#include "util/SystemInfo.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace wattrec::app {

wattrec::model::StatSummary summarize(const std::vector<double>& series) {
  wattrec::model::StatSummary s{};
  if (series.empty()) return s;
  auto [lo, hi] = std::minmax_element(series.begin(), series.end());
  double sum = std::accumulate(series.begin(), series.end(), 0.0);
  s.available = true;
  s.min = *lo;
  s.max = *hi;
  // Rounding in the sum can push the mean a hair outside [min, max].
  s.mean = std::clamp(sum / static_cast<double>(series.size()), s.min, s.max);
  return s;
}

wattrec::model::RunRecord build_record(const wattrec::model::RunSeries& series,
                                       std::chrono::system_clock::time_point start,
                                       std::chrono::system_clock::time_point end,
                                       std::string os_label,
                                       std::string power_source) {
  using std::chrono::seconds;
  wattrec::model::RunRecord r;
  r.start_ts = wattrec::util::utc_timestamp(start);
  r.end_ts = wattrec::util::utc_timestamp(end);
  // Whole seconds between the two printed timestamps
  auto secs = std::chrono::floor<seconds>(end) - std::chrono::floor<seconds>(start);
  r.elapsed_s = std::max<long long>(0, secs.count());
  r.os_label = std::move(os_label);
  r.power_source = std::move(power_source);
  // A backend that never produced a reading is named but flagged
  if (series.watts.empty() && !r.power_source.empty() && r.power_source != "none")
    r.power_source += " (unavailable)";
  r.cpu = summarize(series.cpu_pct);
  r.ram = summarize(series.ram_mb);
  r.watts = summarize(series.watts);
  r.has_energy = !series.watts.empty();
  r.energy_wh = series.energy_j / 3600.0;
  return r;
}

} // namespace wattrec::app
