#pragma once

#include <cstdint>
#include <utility>

namespace ssair::ir {

// SSA variable identity. Index into the owning function's VarTable; assigned
// monotonically and never reused.
struct VarId {
  uint32_t value = 0;

  auto operator==(const VarId&) const -> bool = default;
  auto operator<=>(const VarId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, VarId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// BlockId is a function-local index into Function::blocks.
struct BlockId {
  uint32_t value = 0;

  auto operator==(const BlockId&) const -> bool = default;
  auto operator<=>(const BlockId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, BlockId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// Compiled-unit index of a function (its CFG number).
struct FunctionId {
  uint32_t value = 0;

  auto operator==(const FunctionId&) const -> bool = default;
  auto operator<=>(const FunctionId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, FunctionId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// Compiler intrinsic, indexed by its AST function number.
struct BuiltinId {
  uint32_t value = 0;

  auto operator==(const BuiltinId&) const -> bool = default;
  auto operator<=>(const BuiltinId&) const = default;
};

}  // namespace ssair::ir
