#pragma once
#include <optional>

namespace wattrec::collectors {

// One platform-specific way of obtaining a power reading. Exactly one
// backend is active per run; callers never branch on which.
class IPowerBackend {
public:
  virtual ~IPowerBackend() = default;

  // Watts (>= 0) for this tick, or std::nullopt when no reading could be
  // produced. Internal failures are converted to std::nullopt.
  [[nodiscard]] virtual std::optional<double> sample() noexcept = 0;

  // Short identifier for diagnostics and the report ("rapl", "none", ...)
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace wattrec::collectors
