#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ssair/ir/expression.hpp"
#include "ssair/ir/function.hpp"
#include "ssair/ir/handle.hpp"
#include "ssair/ir/instruction.hpp"
#include "ssair/ir/type.hpp"

namespace ssair::ir {

// Incremental construction of one Function. Blocks are appended in creation
// order; instructions go to the current insert block. Misplaced
// instructions are rejected at emission time so the offending call site is
// on the stack.
class FunctionBuilder {
 public:
  FunctionBuilder(
      FunctionId id, std::string name, std::vector<Type> params,
      std::vector<Type> returns);

  auto NewBlock(std::string name) -> BlockId;
  void SetInsertBlock(BlockId block);

  [[nodiscard]] auto CurrentBlock() const -> BlockId;

  auto DeclareVar(Type type, std::optional<std::string> name = std::nullopt)
      -> VarId;

  [[nodiscard]] auto Vars() const -> const VarTable& {
    return func_.vars;
  }

  // Throws InternalError when the current block is already terminated, or
  // when a phi follows a non-phi.
  void Emit(Instruction insn);

  // Declares `type` and emits `%new = expr;`.
  auto EmitSet(
      Type type, Expression expr,
      std::optional<std::string> name = std::nullopt) -> VarId;

  // Verifies the function and hands it over. The builder is spent
  // afterwards.
  auto Finish(BlockId entry) -> Function;

 private:
  void CheckLive(const char* op) const;

  Function func_;
  std::optional<BlockId> current_;
  bool finished_ = false;
};

}  // namespace ssair::ir
