#pragma once
#include <cstdint>

namespace wattrec::model {

struct Memory {
  uint64_t used_kb{};

  double used_mb() const { return static_cast<double>(used_kb) / 1024.0; }
};

} // namespace wattrec::model
