#pragma once

#include <string>
#include <vector>

#include "ssair/ir/basic_block.hpp"
#include "ssair/ir/handle.hpp"
#include "ssair/ir/type.hpp"
#include "ssair/ir/vartable.hpp"

namespace ssair::ir {

// A lowered function body. Owns its variables and blocks; BlockId values
// index `blocks`.
struct Function {
  FunctionId id;
  std::string name;
  std::vector<Type> params;
  std::vector<Type> returns;

  VarTable vars;
  std::vector<BasicBlock> blocks;
  BlockId entry;
};

}  // namespace ssair::ir
