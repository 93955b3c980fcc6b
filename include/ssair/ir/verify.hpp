#pragma once

#include <string_view>

#include "ssair/ir/function.hpp"

namespace ssair::ir {

// Verify IR function invariants. Throws InternalError on failure.
// label: descriptive name for error messages (e.g., "Token.transfer").
//
// Invariants checked:
// - entry names an existing block
// - Every block is non-empty: phis, then effects, then exactly one
//   terminator in last position
// - Each variable is defined at most once across the function
// - Every defined or referenced variable exists in the VarTable
// - Branch, BranchCond, Switch and Phi name existing blocks
// - A phi lists each predecessor at most once
// - FunctionArgExpr indexes an existing parameter
// - AllocDynamicBytesExpr with a literal size has an initializer of exactly
//   that many bytes
void VerifyFunction(const Function& func, std::string_view label = "function");

}  // namespace ssair::ir
