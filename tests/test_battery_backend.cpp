#include "minitest.hpp"
#include "collectors/BatteryPowerBackend.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;
using wattrec::collectors::BatteryPowerBackend;
using wattrec::model::BatteryStatus;

static BatteryStatus discharging(double pct, double secs, double full_wh) {
  BatteryStatus b;
  b.present = true; b.plugged = false; b.percent = pct;
  b.seconds_left = secs; b.full_capacity_wh = full_wh;
  return b;
}

TEST(battery_estimate_from_time_to_empty) {
  // 50 Wh * 60% = 30 Wh left over 2 h
  auto w = BatteryPowerBackend::estimate_watts(discharging(60.0, 7200.0, 50.0));
  ASSERT_TRUE(w.has_value());
  ASSERT_NEAR(*w, 15.0, 1e-9);
}

TEST(battery_unavailable_cases) {
  auto b = discharging(80.0, 3600.0, 40.0);
  b.plugged = true;
  ASSERT_TRUE(!BatteryPowerBackend::estimate_watts(b).has_value());

  b = discharging(80.0, 3600.0, 40.0);
  b.present = false;
  ASSERT_TRUE(!BatteryPowerBackend::estimate_watts(b).has_value());

  b = discharging(80.0, 3600.0, 40.0);
  b.seconds_left.reset();
  ASSERT_TRUE(!BatteryPowerBackend::estimate_watts(b).has_value());

  b = discharging(80.0, 0.0, 40.0);
  ASSERT_TRUE(!BatteryPowerBackend::estimate_watts(b).has_value());

  b = discharging(80.0, 3600.0, 40.0);
  b.full_capacity_wh.reset();
  ASSERT_TRUE(!BatteryPowerBackend::estimate_watts(b).has_value());

  // unknown or empty charge level is no reading, not 0 W
  b = discharging(80.0, 3600.0, 40.0);
  b.percent.reset();
  ASSERT_TRUE(!BatteryPowerBackend::estimate_watts(b).has_value());
  b = discharging(0.0, 3600.0, 40.0);
  ASSERT_TRUE(!BatteryPowerBackend::estimate_watts(b).has_value());
}

TEST(battery_sample_uses_provider) {
  int calls = 0;
  BatteryPowerBackend b([&]() -> std::optional<BatteryStatus> {
    ++calls;
    if (calls == 1) return std::nullopt;
    return discharging(100.0, 3600.0, 10.0);
  });
  ASSERT_TRUE(!b.sample().has_value());
  auto w = b.sample();
  ASSERT_TRUE(w.has_value());
  ASSERT_NEAR(*w, 10.0, 1e-9);
  ASSERT_EQ(std::string(b.name()), std::string("battery"));
}

TEST(battery_provider_exception_is_unavailable) {
  BatteryPowerBackend b([]() -> std::optional<BatteryStatus> { throw std::runtime_error("acpi"); });
  ASSERT_TRUE(!b.sample().has_value());
}

static void put(const fs::path& p, const std::string& v) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << v << "\n";
}

TEST(battery_reads_sysfs_power_supply) {
  auto root = fs::temp_directory_path() / "wattrec_test_battery" / std::to_string(::getpid());
  fs::remove_all(root);
  auto ps = root / "sys/class/power_supply";
  put(ps / "AC/type", "Mains");
  put(ps / "AC/online", "0");
  put(ps / "BAT0/type", "Battery");
  put(ps / "BAT0/present", "1");
  put(ps / "BAT0/status", "Discharging");
  put(ps / "BAT0/capacity", "50");
  put(ps / "BAT0/energy_full", "40000000");  // 40 Wh
  put(ps / "BAT0/energy_now", "20000000");   // 20 Wh
  put(ps / "BAT0/power_now", "10000000");    // 10 W
  setenv("WATTREC_SYS_ROOT", root.c_str(), 1);

  auto st = BatteryPowerBackend::read_platform_battery();
  ASSERT_TRUE(st.has_value());
  ASSERT_TRUE(st->present);
  ASSERT_TRUE(!st->plugged);
  ASSERT_TRUE(st->percent.has_value());
  ASSERT_NEAR(*st->percent, 50.0, 1e-9);
  ASSERT_TRUE(st->full_capacity_wh.has_value());
  ASSERT_NEAR(*st->full_capacity_wh, 40.0, 1e-9);
  ASSERT_TRUE(st->seconds_left.has_value());
  ASSERT_NEAR(*st->seconds_left, 7200.0, 1e-6);

  BatteryPowerBackend b;
  auto w = b.sample();
  ASSERT_TRUE(w.has_value());
  ASSERT_NEAR(*w, 10.0, 1e-6);

  put(ps / "AC/online", "1");
  ASSERT_TRUE(!b.sample().has_value());

  unsetenv("WATTREC_SYS_ROOT");
  fs::remove_all(root);
}

TEST(battery_charge_based_supply_without_mains) {
  auto root = fs::temp_directory_path() / "wattrec_test_battery_charge" / std::to_string(::getpid());
  fs::remove_all(root);
  auto ps = root / "sys/class/power_supply";
  put(ps / "BAT1/type", "Battery");
  put(ps / "BAT1/status", "Discharging");
  put(ps / "BAT1/capacity", "25");
  put(ps / "BAT1/charge_full", "4000000");         // 4 Ah
  put(ps / "BAT1/voltage_min_design", "12000000"); // 12 V
  put(ps / "BAT1/time_to_empty_now", "1800");
  setenv("WATTREC_SYS_ROOT", root.c_str(), 1);

  auto st = BatteryPowerBackend::read_platform_battery();
  ASSERT_TRUE(st.has_value());
  ASSERT_TRUE(!st->plugged);
  ASSERT_NEAR(*st->full_capacity_wh, 48.0, 1e-9);
  // 48 Wh * 25% = 12 Wh over half an hour
  auto w = BatteryPowerBackend::estimate_watts(*st);
  ASSERT_TRUE(w.has_value());
  ASSERT_NEAR(*w, 24.0, 1e-9);

  put(ps / "BAT1/status", "Charging");
  st = BatteryPowerBackend::read_platform_battery();
  ASSERT_TRUE(st.has_value());
  ASSERT_TRUE(st->plugged);

  unsetenv("WATTREC_SYS_ROOT");
  fs::remove_all(root);
}

TEST(battery_absent_in_sysfs) {
  auto root = fs::temp_directory_path() / "wattrec_test_battery_none" / std::to_string(::getpid());
  fs::remove_all(root);
  put(root / "sys/class/power_supply/AC/type", "Mains");
  setenv("WATTREC_SYS_ROOT", root.c_str(), 1);
  ASSERT_TRUE(!BatteryPowerBackend::read_platform_battery().has_value());
  unsetenv("WATTREC_SYS_ROOT");
  fs::remove_all(root);
}

TEST(battery_without_capacity_file) {
  auto root = fs::temp_directory_path() / "wattrec_test_battery_nocap" / std::to_string(::getpid());
  fs::remove_all(root);
  auto ps = root / "sys/class/power_supply";
  put(ps / "BAT0/type", "Battery");
  put(ps / "BAT0/status", "Discharging");
  put(ps / "BAT0/energy_full", "40000000");
  put(ps / "BAT0/time_to_empty_now", "3600");
  setenv("WATTREC_SYS_ROOT", root.c_str(), 1);

  // no level to scale by: unavailable
  auto st = BatteryPowerBackend::read_platform_battery();
  ASSERT_TRUE(st.has_value());
  ASSERT_TRUE(!st->percent.has_value());
  BatteryPowerBackend b;
  ASSERT_TRUE(!b.sample().has_value());

  // level derived from energy_now / energy_full: 30 Wh over one hour
  put(ps / "BAT0/energy_now", "30000000");
  st = BatteryPowerBackend::read_platform_battery();
  ASSERT_TRUE(st.has_value() && st->percent.has_value());
  ASSERT_NEAR(*st->percent, 75.0, 1e-9);
  auto w = b.sample();
  ASSERT_TRUE(w.has_value());
  ASSERT_NEAR(*w, 30.0, 1e-9);

  unsetenv("WATTREC_SYS_ROOT");
  fs::remove_all(root);
}

TEST(battery_level_from_charge_counters) {
  auto root = fs::temp_directory_path() / "wattrec_test_battery_chargelvl" / std::to_string(::getpid());
  fs::remove_all(root);
  auto ps = root / "sys/class/power_supply";
  put(ps / "BAT0/type", "Battery");
  put(ps / "BAT0/status", "Discharging");
  put(ps / "BAT0/charge_full", "5000000");
  put(ps / "BAT0/charge_now", "1000000");
  put(ps / "BAT0/voltage_min_design", "10000000");
  put(ps / "BAT0/time_to_empty_now", "1800");
  setenv("WATTREC_SYS_ROOT", root.c_str(), 1);

  auto st = BatteryPowerBackend::read_platform_battery();
  ASSERT_TRUE(st.has_value() && st->percent.has_value());
  ASSERT_NEAR(*st->percent, 20.0, 1e-9);
  // 50 Wh * 20% = 10 Wh over half an hour
  auto w = BatteryPowerBackend::estimate_watts(*st);
  ASSERT_TRUE(w.has_value());
  ASSERT_NEAR(*w, 20.0, 1e-9);

  unsetenv("WATTREC_SYS_ROOT");
  fs::remove_all(root);
}
