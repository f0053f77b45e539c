#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <cstdlib>
#include <string>
#include <string_view>

#if defined(__APPLE__)
#include <mach/mach.h>
#include <mach/mach_host.h>
#elif defined(_WIN32)
#include <windows.h>
#endif

namespace wattrec::collectors {

#if defined(__APPLE__)

bool CpuCollector::read_times(wattrec::model::CpuTimes& agg) {
  host_cpu_load_info_data_t info;
  mach_msg_type_number_t count = HOST_CPU_LOAD_INFO_COUNT;
  if (host_statistics(mach_host_self(), HOST_CPU_LOAD_INFO,
                      reinterpret_cast<host_info_t>(&info), &count) != KERN_SUCCESS) {
    return false;
  }
  agg = {};
  agg.user   = info.cpu_ticks[CPU_STATE_USER];
  agg.nice   = info.cpu_ticks[CPU_STATE_NICE];
  agg.system = info.cpu_ticks[CPU_STATE_SYSTEM];
  agg.idle   = info.cpu_ticks[CPU_STATE_IDLE];
  return true;
}

#elif defined(_WIN32)

static uint64_t filetime_u64(const FILETIME& ft) {
  return (static_cast<uint64_t>(ft.dwHighDateTime) << 32) | ft.dwLowDateTime;
}

bool CpuCollector::read_times(wattrec::model::CpuTimes& agg) {
  FILETIME idle{}, kernel{}, user{};
  if (!::GetSystemTimes(&idle, &kernel, &user)) return false;
  agg = {};
  agg.idle   = filetime_u64(idle);
  agg.system = filetime_u64(kernel) - agg.idle; // kernel time includes idle
  agg.user   = filetime_u64(user);
  return true;
}

#else

static void parse_cpu_line(std::string_view line, wattrec::model::CpuTimes& out) {
  // line starts with 'cpu' or 'cpuN'
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      vals[i++] = std::strtoull(std::string(rest.substr(start, end - start)).c_str(), nullptr, 10);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

bool CpuCollector::read_times(wattrec::model::CpuTimes& agg) {
  auto txt_opt = wattrec::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { agg = {}; parse_cpu_line(line, agg); return true; }
    start = end + 1;
  }
  return false;
}

#endif

bool CpuCollector::sample(wattrec::model::CpuSample& out) {
  wattrec::model::CpuTimes agg{};
  if (!read_times(agg)) return false;
  double usage = 0.0;
  if (has_last_) {
    // Counters can step backwards after CPU hotplug; treat that as idle.
    auto total = agg.total(), last_total = last_total_.total();
    auto work = agg.work(), last_work = last_total_.work();
    uint64_t td = total > last_total ? total - last_total : 0;
    uint64_t wd = work > last_work ? work - last_work : 0;
    usage = (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
    if (usage > 100.0) usage = 100.0;
  }
  last_total_ = agg; has_last_ = true;
  out.usage_pct = usage;
  return true;
}

} // namespace wattrec::collectors
