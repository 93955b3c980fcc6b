#pragma once

#include <string>
#include <vector>

#include "ssair/ir/instruction.hpp"

namespace ssair::ir {

// Straight-line run of instructions: phis first, then effects, then exactly
// one terminator, always last.
struct BasicBlock {
  std::string name;
  std::vector<Instruction> instructions;
};

}  // namespace ssair::ir
