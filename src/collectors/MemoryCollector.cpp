#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>

#if defined(__APPLE__)
#include <mach/mach.h>
#include <mach/mach_host.h>
#include <sys/sysctl.h>
#elif defined(_WIN32)
#include <windows.h>
#endif

namespace wattrec::collectors {

#if defined(__APPLE__)

bool MemoryCollector::sample(wattrec::model::Memory& out) const {
  mach_port_t host = mach_host_self();
  vm_size_t page_size = 0;
  if (host_page_size(host, &page_size) != KERN_SUCCESS) return false;
  vm_statistics64_data_t vm{};
  mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
  if (host_statistics64(host, HOST_VM_INFO64, reinterpret_cast<host_info64_t>(&vm), &count) != KERN_SUCCESS)
    return false;
  uint64_t total = 0; size_t size = sizeof(total);
  if (sysctlbyname("hw.memsize", &total, &size, nullptr, 0) != 0) return false;
  uint64_t used = (static_cast<uint64_t>(vm.active_count) + vm.wire_count + vm.compressor_page_count) * page_size;
  if (total == 0) return false;
  out.used_kb = std::min(used, total) / 1024;
  return true;
}

#elif defined(_WIN32)

bool MemoryCollector::sample(wattrec::model::Memory& out) const {
  MEMORYSTATUSEX ms{};
  ms.dwLength = sizeof(ms);
  if (!::GlobalMemoryStatusEx(&ms)) return false;
  out.used_kb = (ms.ullTotalPhys - ms.ullAvailPhys) / 1024;
  return true;
}

#else

static inline uint64_t parse_u64(std::string_view s) {
  uint64_t v = 0;
  // strip non-digits on right (e.g., kB)
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

bool MemoryCollector::sample(wattrec::model::Memory& out) const {
  auto txt_opt = wattrec::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mem_total = parse_u64(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_u64(line.substr(8));
    else if (line.starts_with("MemAvailable:")) mem_avail = parse_u64(line.substr(13));
    else if (line.starts_with("Buffers:")) buffers = parse_u64(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_u64(line.substr(7));
    start = end + 1;
  }
  if (mem_total == 0) return false;

  if (mem_avail > 0) {
    out.used_kb = (mem_total > mem_avail) ? (mem_total - mem_avail) : 0;
  } else {
    uint64_t sum = mem_free + buffers + cached;
    out.used_kb = (mem_total > sum) ? (mem_total - sum) : 0;
  }
  return true;
}

#endif

} // namespace wattrec::collectors
