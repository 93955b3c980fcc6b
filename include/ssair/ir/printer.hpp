#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "ssair/ir/basic_block.hpp"
#include "ssair/ir/expression.hpp"
#include "ssair/ir/function.hpp"
#include "ssair/ir/instruction.hpp"
#include "ssair/ir/operand.hpp"
#include "ssair/ir/type.hpp"
#include "ssair/ir/vartable.hpp"

namespace ssair::ir {

// Canonical text form of the IR. Output is byte-stable: tests diff it.
// Every variable reference is checked against the table; an unknown
// identity is an InternalError rather than a best-effort rendering.
class Printer {
 public:
  Printer(const VarTable* vars, std::ostream* out);

  [[nodiscard]] auto FormatType(const Type& type) const -> std::string;
  [[nodiscard]] auto FormatOperand(const Operand& op) const -> std::string;
  [[nodiscard]] auto FormatExpression(const Expression& expr) const
      -> std::string;
  [[nodiscard]] auto FormatInstruction(const Instruction& insn) const
      -> std::string;

  // Whole-function dump. The function must own the table this printer was
  // built with.
  void Print(const Function& func);
  void PrintBlock(const BasicBlock& bb, BlockId id);

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  [[nodiscard]] auto FormatVar(VarId id) const -> std::string;
  [[nodiscard]] auto FormatOptional(
      const char* label, const std::optional<Operand>& op) const -> std::string;
  [[nodiscard]] auto FormatOperandList(const std::vector<Operand>& ops) const
      -> std::string;
  [[nodiscard]] auto FormatStringLocation(const StringLocation& loc) const
      -> std::string;

  const VarTable* vars_;
  std::ostream* out_;
  int indent_ = 0;
};

// Convenience wrapper: Printer over func.vars writing to `out`.
void PrintFunction(const Function& func, std::ostream& out);

}  // namespace ssair::ir
