#include "collectors/PowerBackendFactory.hpp"
#include "collectors/BatteryPowerBackend.hpp"
#include "collectors/NullPowerBackend.hpp"
#include "collectors/PowermetricsPowerBackend.hpp"
#include "collectors/RaplPowerBackend.hpp"

#include <cctype>
#include <cstdio>
#include <string>

namespace wattrec::collectors {

std::optional<PowerBackendKind> parse_power_backend_kind(std::string_view s) {
  std::string v(s);
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (v.empty() || v == "auto") return PowerBackendKind::Auto;
  if (v == "rapl") return PowerBackendKind::Rapl;
  if (v == "powermetrics") return PowerBackendKind::Powermetrics;
  if (v == "battery") return PowerBackendKind::Battery;
  if (v == "none" || v == "off") return PowerBackendKind::None;
  return std::nullopt;
}

const char* to_string(PowerBackendKind kind) {
  switch (kind) {
    case PowerBackendKind::Auto: return "auto";
    case PowerBackendKind::Rapl: return "rapl";
    case PowerBackendKind::Powermetrics: return "powermetrics";
    case PowerBackendKind::Battery: return "battery";
    case PowerBackendKind::None: return "none";
  }
  return "none";
}

PowerBackendKind platform_power_backend() {
#if defined(__linux__)
  return PowerBackendKind::Rapl;
#elif defined(__APPLE__)
  return PowerBackendKind::Powermetrics;
#elif defined(_WIN32)
  return PowerBackendKind::Battery;
#else
  return PowerBackendKind::None;
#endif
}

std::unique_ptr<IPowerBackend> make_power_backend(PowerBackendKind kind, std::chrono::milliseconds timeout) {
  if (kind == PowerBackendKind::Auto) kind = platform_power_backend();
  switch (kind) {
    case PowerBackendKind::Rapl: {
      std::size_t domains = 0;
      if (RaplPowerBackend::read_energy_uj(&domains)) {
        std::fprintf(stderr, "wattrec: PowerBackend: using rapl (%zu package domain(s))\n", domains);
      } else {
        std::fprintf(stderr, "wattrec: PowerBackend: no readable RAPL counters (root may be required)\n");
      }
      return std::make_unique<RaplPowerBackend>();
    }
    case PowerBackendKind::Powermetrics:
      return std::make_unique<PowermetricsPowerBackend>(timeout);
    case PowerBackendKind::Battery:
      return std::make_unique<BatteryPowerBackend>();
    case PowerBackendKind::None:
    case PowerBackendKind::Auto:
      break;
  }
  return std::make_unique<NullPowerBackend>();
}

} // namespace wattrec::collectors
