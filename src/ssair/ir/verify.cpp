#include "ssair/ir/verify.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ssair/common/integral_constant.hpp"
#include "ssair/common/internal_error.hpp"
#include "ssair/ir/expression.hpp"
#include "ssair/ir/instruction.hpp"

namespace ssair::ir {

namespace {

// Where a variable was first defined (for duplicate-definition messages).
struct Definition {
  size_t block_idx;
  size_t insn_idx;
};

auto FormatLocation(size_t block_idx, size_t insn_idx) -> std::string {
  return fmt::format("block {} insn {}", block_idx, insn_idx);
}

[[noreturn]] void Fail(
    std::string_view label, size_t block_idx, size_t insn_idx,
    const std::string& detail) {
  throw common::InternalError(
      "IR verify",
      fmt::format(
          "{}: {}: {}", label, FormatLocation(block_idx, insn_idx), detail));
}

class FunctionVerifier {
 public:
  FunctionVerifier(const Function& func, std::string_view label)
      : func_(func), label_(label) {
  }

  void Run() {
    if (func_.entry.value >= func_.blocks.size()) {
      throw common::InternalError(
          "IR verify",
          fmt::format(
              "{}: entry block#{} out of range ({} blocks)", label_,
              func_.entry.value, func_.blocks.size()));
    }
    for (size_t b = 0; b < func_.blocks.size(); ++b) {
      VerifyBlockShape(b);
      const auto& insns = func_.blocks[b].instructions;
      for (size_t i = 0; i < insns.size(); ++i) {
        VerifyInstruction(b, i, insns[i]);
      }
    }
  }

 private:
  void VerifyBlockShape(size_t b) {
    const auto& insns = func_.blocks[b].instructions;
    if (insns.empty()) {
      throw common::InternalError(
          "IR verify", fmt::format("{}: block {} is empty", label_, b));
    }
    bool past_phis = false;
    for (size_t i = 0; i < insns.size(); ++i) {
      const bool last = i + 1 == insns.size();
      if (IsPhi(insns[i])) {
        if (past_phis) {
          Fail(label_, b, i, "phi after a non-phi instruction");
        }
        continue;
      }
      past_phis = true;
      if (IsTerminator(insns[i]) && !last) {
        Fail(label_, b, i + 1, "instruction after terminator");
      }
      if (!IsTerminator(insns[i]) && last) {
        Fail(label_, b, i, "block does not end in a terminator");
      }
    }
    if (IsPhi(insns.back())) {
      Fail(label_, b, insns.size() - 1, "block does not end in a terminator");
    }
  }

  void CheckVar(size_t b, size_t i, VarId id, const char* role) {
    if (!func_.vars.Contains(id)) {
      Fail(
          label_, b, i,
          fmt::format(
              "{} %{} not in variable table (size={})", role, id.value,
              func_.vars.Size()));
    }
  }

  void CheckBlock(size_t b, size_t i, BlockId target) {
    if (target.value >= func_.blocks.size()) {
      Fail(
          label_, b, i,
          fmt::format(
              "block#{} out of range ({} blocks)", target.value,
              func_.blocks.size()));
    }
  }

  void VerifyInstruction(size_t b, size_t i, const Instruction& insn) {
    for (VarId id : DefinedVars(insn)) {
      CheckVar(b, i, id, "result");
      auto [it, inserted] = definitions_.try_emplace(id, Definition{b, i});
      if (!inserted) {
        Fail(
            label_, b, i,
            fmt::format(
                "%{} already defined at {}", id.value,
                FormatLocation(it->second.block_idx, it->second.insn_idx)));
      }
    }
    for (const Operand* op : UsedOperands(insn)) {
      if (op->IsId()) {
        CheckVar(b, i, op->AsVar(), "operand");
      }
    }
    for (VarId id : UsedVarIds(insn)) {
      CheckVar(b, i, id, "operand");
    }
    for (BlockId target : Successors(insn)) {
      CheckBlock(b, i, target);
    }
    if (const auto* phi = std::get_if<Phi>(&insn.data)) {
      VerifyPhi(b, i, *phi);
    }
    if (const auto* set = std::get_if<Set>(&insn.data)) {
      VerifyExpression(b, i, set->expr);
    }
  }

  void VerifyPhi(size_t b, size_t i, const Phi& phi) {
    absl::flat_hash_set<BlockId> seen;
    for (const auto& input : phi.inputs) {
      CheckBlock(b, i, input.block);
      if (!seen.insert(input.block).second) {
        Fail(
            label_, b, i,
            fmt::format(
                "phi lists predecessor block#{} twice", input.block.value));
      }
    }
  }

  void VerifyExpression(size_t b, size_t i, const Expression& expr) {
    if (const auto* arg = std::get_if<FunctionArgExpr>(&expr.data)) {
      if (arg->index >= func_.params.size()) {
        Fail(
            label_, b, i,
            fmt::format(
                "arg#{} out of range ({} params)", arg->index,
                func_.params.size()));
      }
    }
    if (const auto* alloc = std::get_if<AllocDynamicBytesExpr>(&expr.data)) {
      if (alloc->initializer &&
          alloc->size.kind == Operand::Kind::kNumberLiteral) {
        const auto& size = alloc->size.AsNumber().value;
        const auto expected =
            common::IntegralConstant::FromUint64(alloc->initializer->size());
        if (size != expected) {
          Fail(
              label_, b, i,
              fmt::format(
                  "alloc of {} bytes has a {}-byte initializer",
                  size.ToString(), alloc->initializer->size()));
        }
      }
    }
  }

  const Function& func_;
  std::string_view label_;
  absl::flat_hash_map<VarId, Definition> definitions_;
};

}  // namespace

void VerifyFunction(const Function& func, std::string_view label) {
  FunctionVerifier(func, label).Run();
  spdlog::debug(
      "IR verify {}: {} blocks, {} vars ok", label, func.blocks.size(),
      func.vars.Size());
}

}  // namespace ssair::ir
