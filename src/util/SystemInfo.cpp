#include "util/SystemInfo.hpp"
#include "util/Procfs.hpp"

#include <cstdio>
#include <ctime>
#include <sstream>

#if defined(_WIN32)
#include <windows.h>
#else
#include <sys/utsname.h>
#endif
#if defined(__APPLE__)
#include <sys/sysctl.h>
#include <sys/time.h>
#endif

namespace wattrec::util {

std::string os_label() {
#if defined(_WIN32)
  return "Windows";
#else
  struct utsname info;
  if (::uname(&info) == 0) {
    return std::string(info.sysname) + " " + info.release;
  }
  return "unknown";
#endif
}

std::optional<uint64_t> uptime_seconds() {
#if defined(_WIN32)
  return static_cast<uint64_t>(::GetTickCount64() / 1000);
#elif defined(__APPLE__)
  struct timeval boot{};
  size_t size = sizeof(boot);
  int mib[2] = {CTL_KERN, KERN_BOOTTIME};
  if (::sysctl(mib, 2, &boot, &size, nullptr, 0) != 0 || boot.tv_sec == 0) return std::nullopt;
  std::time_t now = std::time(nullptr);
  if (now < boot.tv_sec) return std::nullopt;
  return static_cast<uint64_t>(now - boot.tv_sec);
#else
  auto txt = read_file_string("/proc/uptime");
  if (!txt) return std::nullopt;
  std::istringstream ss(*txt);
  double up = 0.0;
  if (!(ss >> up) || up < 0.0) return std::nullopt;
  return static_cast<uint64_t>(up);
#endif
}

std::string format_uptime(uint64_t seconds) {
  uint64_t days = seconds / 86400;
  uint64_t hours = (seconds % 86400) / 3600;
  uint64_t minutes = (seconds % 3600) / 60;
  uint64_t secs = seconds % 60;
  std::ostringstream os;
  if (days) os << days << "d ";
  if (hours) os << hours << "h ";
  if (minutes) os << minutes << "m ";
  os << secs << "s";
  return os.str();
}

std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  ::gmtime_s(&tm, &t);
#else
  ::gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d_%02d-%02d-%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

} // namespace wattrec::util
