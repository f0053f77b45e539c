#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "model/Record.hpp"

namespace wattrec::app {

// min/max/mean of a series; an empty series yields available == false.
[[nodiscard]] wattrec::model::StatSummary summarize(const std::vector<double>& series);

// Reduce the collected series into the immutable record written at exit.
// power_source gets an " (unavailable)" suffix when the series holds no
// wattage at all.
[[nodiscard]] wattrec::model::RunRecord build_record(const wattrec::model::RunSeries& series,
                                                     std::chrono::system_clock::time_point start,
                                                     std::chrono::system_clock::time_point end,
                                                     std::string os_label,
                                                     std::string power_source);

} // namespace wattrec::app
