#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "collectors/IPowerBackend.hpp"
#include "util/Subprocess.hpp"

namespace wattrec::collectors {

// Package power on macOS from the privileged `powermetrics` utility, run
// through `sudo -n` so a missing sudo grant fails fast instead of prompting.
class PowermetricsPowerBackend final : public IPowerBackend {
public:
  using Runner = std::function<wattrec::util::CommandResult(const std::vector<std::string>&,
                                                            std::chrono::milliseconds)>;

  explicit PowermetricsPowerBackend(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000),
                                    Runner runner = {});

  [[nodiscard]] std::optional<double> sample() noexcept override;
  [[nodiscard]] const char* name() const override { return "powermetrics"; }

  // smc.package_watts from the JSON form of the output.
  static std::optional<double> parse_json(const std::string& out);
  // First wattage on a cpu/processor/package power line of the text form.
  static std::optional<double> parse_text(const std::string& out);

  static std::vector<std::string> base_command();

private:
  std::optional<double> query();

  std::chrono::milliseconds timeout_;
  Runner runner_;
  bool warned_{false};
};

} // namespace wattrec::collectors
