#pragma once
#include "model/Memory.hpp"

namespace wattrec::collectors {

class MemoryCollector {
public:
  bool sample(wattrec::model::Memory& out) const; // returns true on success
};

} // namespace wattrec::collectors
