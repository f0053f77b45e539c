#include "collectors/RaplPowerBackend.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace wattrec::collectors {

static double steady_seconds() {
  return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

// "intel-rapl:0" is a package; "intel-rapl:0:1" is a subzone already
// included in its package counter.
static bool is_package_domain(const std::string& name) {
  if (name.rfind("intel-rapl:", 0) != 0) return false;
  return name.find(':', 11) == std::string::npos && name.size() > 11;
}

RaplPowerBackend::RaplPowerBackend(wattrec::model::RaplState state, Clock clock)
    : state_(std::move(state)), clock_(std::move(clock)) {
  if (!clock_) clock_ = &steady_seconds;
}

std::optional<uint64_t> RaplPowerBackend::read_energy_uj(std::size_t* domains) {
  uint64_t total = 0;
  std::size_t n = 0;
  for (const auto& entry : wattrec::util::list_dir("/sys/class/powercap")) {
    if (!is_package_domain(entry)) continue;
    // energy_uj is root-only on recent kernels; unreadable domains are skipped
    auto v = wattrec::util::read_file_u64("/sys/class/powercap/" + entry + "/energy_uj");
    if (!v) continue;
    total += *v; ++n;
  }
  if (domains) *domains = n;
  if (n == 0 || total == 0) return std::nullopt;
  return total;
}

double RaplPowerBackend::watts_between(const wattrec::model::RaplState& prev, uint64_t energy_uj, double time_s) {
  double dt = time_s - prev.time_s;
  if (dt <= 0.0) return 0.0;
  double de = static_cast<double>(energy_uj) - static_cast<double>(prev.energy_uj);
  return std::max(de / dt / 1e6, 0.0);
}

std::optional<double> RaplPowerBackend::sample() noexcept {
  try {
    auto energy = read_energy_uj();
    if (!energy) return std::nullopt;
    double now = clock_();
    if (!state_.primed || now <= state_.time_s) {
      state_ = {true, *energy, now};
      return std::nullopt;
    }
    double w = watts_between(state_, *energy, now);
    state_ = {true, *energy, now};
    return w;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace wattrec::collectors
