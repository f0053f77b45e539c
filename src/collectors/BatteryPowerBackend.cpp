#include "collectors/BatteryPowerBackend.hpp"
#include "util/Procfs.hpp"

#include <cmath>
#include <string>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#include <powrprof.h>
#endif

namespace wattrec::collectors {

BatteryPowerBackend::BatteryPowerBackend(Provider provider) : provider_(std::move(provider)) {
  if (!provider_) provider_ = &BatteryPowerBackend::read_platform_battery;
}

std::optional<double> BatteryPowerBackend::estimate_watts(const wattrec::model::BatteryStatus& b) {
  if (!b.present || b.plugged) return std::nullopt;
  if (!b.percent || !b.seconds_left || !b.full_capacity_wh) return std::nullopt;
  if (*b.percent <= 0.0 || *b.seconds_left <= 0.0 || *b.full_capacity_wh <= 0.0) return std::nullopt;
  double pct = *b.percent > 100.0 ? 100.0 : *b.percent;
  double w = *b.full_capacity_wh * (pct / 100.0) / (*b.seconds_left / 3600.0);
  if (!std::isfinite(w) || w < 0.0) return std::nullopt;
  return w;
}

#ifdef _WIN32

std::optional<wattrec::model::BatteryStatus> BatteryPowerBackend::read_platform_battery() {
  SYSTEM_BATTERY_STATE st{};
  if (::CallNtPowerInformation(SystemBatteryState, nullptr, 0, &st, sizeof(st)) != 0)
    return std::nullopt;
  wattrec::model::BatteryStatus b;
  b.present = st.BatteryPresent != 0;
  b.plugged = st.AcOnLine != 0;
  if (st.MaxCapacity > 0) {
    b.percent = 100.0 * static_cast<double>(st.RemainingCapacity) / static_cast<double>(st.MaxCapacity);
    b.full_capacity_wh = static_cast<double>(st.MaxCapacity) / 1000.0; // mWh
  }
  if (st.EstimatedTime != 0 && st.EstimatedTime != 0xFFFFFFFFu)
    b.seconds_left = static_cast<double>(st.EstimatedTime);
  return b;
}

#else

static std::string read_trimmed(const std::string& path) {
  auto txt = wattrec::util::read_file_string(path);
  if (!txt) return {};
  std::string s = *txt;
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

std::optional<wattrec::model::BatteryStatus> BatteryPowerBackend::read_platform_battery() {
  const std::string base = "/sys/class/power_supply/";
  auto entries = wattrec::util::list_dir(base);
  bool have_mains = false, mains_online = false;
  for (const auto& e : entries) {
    if (read_trimmed(base + e + "/type") != "Mains") continue;
    have_mains = true;
    if (wattrec::util::read_file_u64(base + e + "/online").value_or(0) == 1) mains_online = true;
  }
  for (const auto& e : entries) {
    const std::string dir = base + e + "/";
    if (read_trimmed(dir + "type") != "Battery") continue;
    if (wattrec::util::read_file_u64(dir + "present").value_or(1) == 0) continue;

    wattrec::model::BatteryStatus b;
    b.present = true;
    std::string status = read_trimmed(dir + "status");
    b.plugged = have_mains ? mains_online : (status != "Discharging");

    // energy_* in uWh, charge_* in uAh (scaled by the design voltage in uV)
    std::optional<double> full_uwh, now_uwh, power_uw;
    if (auto v = wattrec::util::read_file_u64(dir + "energy_full")) full_uwh = static_cast<double>(*v);
    if (auto v = wattrec::util::read_file_u64(dir + "energy_now")) now_uwh = static_cast<double>(*v);
    if (auto v = wattrec::util::read_file_u64(dir + "power_now")) power_uw = static_cast<double>(*v);
    if (!full_uwh) {
      auto volt = wattrec::util::read_file_u64(dir + "voltage_min_design");
      auto full = wattrec::util::read_file_u64(dir + "charge_full");
      if (volt && full) full_uwh = static_cast<double>(*full) * static_cast<double>(*volt) / 1e6;
    }
    if (full_uwh && *full_uwh > 0.0) b.full_capacity_wh = *full_uwh / 1e6;

    if (auto cap = wattrec::util::read_file_u64(dir + "capacity")) {
      b.percent = static_cast<double>(*cap);
    } else if (now_uwh && full_uwh && *full_uwh > 0.0) {
      b.percent = 100.0 * *now_uwh / *full_uwh;
    } else {
      auto now = wattrec::util::read_file_u64(dir + "charge_now");
      auto full = wattrec::util::read_file_u64(dir + "charge_full");
      if (now && full && *full > 0) b.percent = 100.0 * static_cast<double>(*now) / static_cast<double>(*full);
    }

    if (auto t = wattrec::util::read_file_u64(dir + "time_to_empty_now")) {
      b.seconds_left = static_cast<double>(*t);
    } else if (now_uwh && power_uw && *power_uw > 0.0) {
      b.seconds_left = *now_uwh / *power_uw * 3600.0;
    }
    return b;
  }
  return std::nullopt;
}

#endif

std::optional<double> BatteryPowerBackend::sample() noexcept {
  try {
    auto b = provider_();
    if (!b) return std::nullopt;
    return estimate_watts(*b);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace wattrec::collectors
