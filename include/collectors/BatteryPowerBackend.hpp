#pragma once
#include <functional>
#include <optional>
#include "collectors/IPowerBackend.hpp"
#include "model/Power.hpp"

namespace wattrec::collectors {

// Rough system draw while discharging, from the battery's remaining energy
// and the platform's time-to-empty estimate.
class BatteryPowerBackend final : public IPowerBackend {
public:
  using Provider = std::function<std::optional<wattrec::model::BatteryStatus>()>;

  explicit BatteryPowerBackend(Provider provider = {});

  [[nodiscard]] std::optional<double> sample() noexcept override;
  [[nodiscard]] const char* name() const override { return "battery"; }

  // full_wh * percent/100 / (seconds_left/3600); nullopt on mains, without
  // a battery, or when capacity or time-to-empty are unknown.
  static std::optional<double> estimate_watts(const wattrec::model::BatteryStatus& b);

  // CallNtPowerInformation on Windows, /sys/class/power_supply elsewhere.
  static std::optional<wattrec::model::BatteryStatus> read_platform_battery();

private:
  Provider provider_;
};

} // namespace wattrec::collectors
