#pragma once
#include "collectors/IPowerBackend.hpp"

namespace wattrec::collectors {

// Used where no power source is known for the platform.
class NullPowerBackend final : public IPowerBackend {
public:
  [[nodiscard]] std::optional<double> sample() noexcept override { return std::nullopt; }
  [[nodiscard]] const char* name() const override { return "none"; }
};

} // namespace wattrec::collectors
