#include "ssair/ir/instruction.hpp"

#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

#include "ssair/common/overloaded.hpp"
#include "ssair/ir/expression.hpp"

namespace ssair::ir {

namespace {

void Push(std::vector<const Operand*>& out, const Operand& op) {
  out.push_back(&op);
}

void Push(std::vector<const Operand*>& out, const std::optional<Operand>& op) {
  if (op) {
    out.push_back(&*op);
  }
}

void Push(std::vector<const Operand*>& out, const std::vector<Operand>& ops) {
  for (const auto& op : ops) {
    out.push_back(&op);
  }
}

}  // namespace

auto ToString(CallTy callty) -> const char* {
  switch (callty) {
    case CallTy::kRegular:
      return "regular";
    case CallTy::kDelegate:
      return "delegate";
    case CallTy::kStatic:
      return "static";
  }
  return "unknown";
}

auto ToString(ReturnCodeKind code) -> const char* {
  switch (code) {
    case ReturnCodeKind::kSuccess:
      return "success";
    case ReturnCodeKind::kFunctionSelectorInvalid:
      return "function selector invalid";
    case ReturnCodeKind::kAbiEncodingInvalid:
      return "abi encoding invalid";
    case ReturnCodeKind::kInvalidDataError:
      return "invalid data error";
    case ReturnCodeKind::kAccountDataTooSmall:
      return "account data too small";
    case ReturnCodeKind::kInvalidProgramId:
      return "invalid program id";
  }
  return "unknown";
}

auto IsTerminator(const Instruction& insn) -> bool {
  return std::visit(
      [](const auto& i) -> bool {
        using T = std::decay_t<decltype(i)>;
        return std::is_same_v<T, Branch> || std::is_same_v<T, BranchCond> ||
               std::is_same_v<T, Switch> || std::is_same_v<T, Return> ||
               std::is_same_v<T, ReturnData> || std::is_same_v<T, ReturnCode> ||
               std::is_same_v<T, AssertFailure> ||
               std::is_same_v<T, Unimplemented>;
      },
      insn.data);
}

auto IsPhi(const Instruction& insn) -> bool {
  return std::holds_alternative<Phi>(insn.data);
}

auto DefinedVars(const Instruction& insn) -> std::vector<VarId> {
  std::vector<VarId> out;
  std::visit(
      Overloaded{
          [&](const Set& i) { out.push_back(i.result); },
          [&](const LoadStorage& i) { out.push_back(i.result); },
          [&](const PushStorage& i) { out.push_back(i.result); },
          [&](const PopStorage& i) {
            if (i.result) {
              out.push_back(*i.result);
            }
          },
          [&](const PushMemory& i) { out.push_back(i.result); },
          [&](const PopMemory& i) { out.push_back(i.result); },
          [&](const Call& i) {
            out.insert(out.end(), i.results.begin(), i.results.end());
          },
          [&](const ExternalCall& i) {
            if (i.success) {
              out.push_back(*i.success);
            }
          },
          [&](const Constructor& i) {
            out.push_back(i.result);
            if (i.success) {
              out.push_back(*i.success);
            }
          },
          [&](const ValueTransfer& i) {
            if (i.success) {
              out.push_back(*i.success);
            }
          },
          [&](const Phi& i) { out.push_back(i.result); },
          [](const auto&) {},
      },
      insn.data);
  return out;
}

auto UsedOperands(const Instruction& insn) -> std::vector<const Operand*> {
  std::vector<const Operand*> out;
  std::visit(
      Overloaded{
          [](const Nop&) {},
          [&](const Set& i) { out = CollectOperands(i.expr); },
          [&](const Store& i) {
            Push(out, i.data);
            Push(out, i.dest);
          },
          [&](const LoadStorage& i) { Push(out, i.storage); },
          [&](const ClearStorage& i) { Push(out, i.storage); },
          [&](const SetStorage& i) {
            Push(out, i.storage);
            Push(out, i.value);
          },
          [&](const SetStorageBytes& i) {
            Push(out, i.storage);
            Push(out, i.offset);
            Push(out, i.value);
          },
          [&](const PushStorage& i) {
            Push(out, i.storage);
            Push(out, i.value);
          },
          [&](const PopStorage& i) { Push(out, i.storage); },
          [&](const PushMemory& i) { Push(out, i.value); },
          [](const PopMemory&) {},
          [&](const MemCopy& i) {
            Push(out, i.source);
            Push(out, i.destination);
            Push(out, i.bytes);
          },
          [&](const WriteBuffer& i) {
            Push(out, i.buf);
            Push(out, i.offset);
            Push(out, i.value);
          },
          [&](const Print& i) { Push(out, i.operand); },
          [&](const EmitEvent& i) {
            Push(out, i.topics);
            Push(out, i.data);
          },
          [&](const Call& i) {
            if (const auto* fn = std::get_if<Operand>(&i.call.callee)) {
              Push(out, *fn);
            }
            Push(out, i.args);
          },
          [&](const ExternalCall& i) {
            Push(out, i.address);
            Push(out, i.payload);
            Push(out, i.value);
            Push(out, i.gas);
            Push(out, i.accounts);
            Push(out, i.seeds);
            Push(out, i.flags);
          },
          [&](const Constructor& i) {
            Push(out, i.salt);
            Push(out, i.value);
            Push(out, i.gas);
            Push(out, i.address);
            Push(out, i.seeds);
            Push(out, i.encoded_args);
            Push(out, i.accounts);
          },
          [&](const ValueTransfer& i) {
            Push(out, i.value);
            Push(out, i.address);
          },
          [&](const SelfDestruct& i) { Push(out, i.recipient); },
          [](const Branch&) {},
          [&](const BranchCond& i) { Push(out, i.cond); },
          [&](const Switch& i) {
            Push(out, i.cond);
            for (const auto& [value, block] : i.cases) {
              Push(out, value);
            }
          },
          [&](const Return& i) { Push(out, i.values); },
          [&](const ReturnData& i) {
            Push(out, i.data);
            Push(out, i.data_len);
          },
          [](const ReturnCode&) {},
          [&](const AssertFailure& i) { Push(out, i.encoded_args); },
          [](const Unimplemented&) {},
          [&](const Phi& i) {
            for (const auto& input : i.inputs) {
              Push(out, input.operand);
            }
          },
      },
      insn.data);
  return out;
}

auto UsedVarIds(const Instruction& insn) -> std::vector<VarId> {
  std::vector<VarId> out;
  std::visit(
      Overloaded{
          [&](const Set& i) {
            if (const auto* id = std::get_if<IdExpr>(&i.expr.data)) {
              out.push_back(id->id);
            }
          },
          [&](const PushMemory& i) { out.push_back(i.array); },
          [&](const PopMemory& i) { out.push_back(i.array); },
          [](const auto&) {},
      },
      insn.data);
  return out;
}

auto Successors(const Instruction& insn) -> std::vector<BlockId> {
  std::vector<BlockId> out;
  std::visit(
      Overloaded{
          [&](const Branch& i) { out.push_back(i.block); },
          [&](const BranchCond& i) {
            out.push_back(i.true_block);
            out.push_back(i.false_block);
          },
          [&](const Switch& i) {
            for (const auto& [value, block] : i.cases) {
              out.push_back(block);
            }
            out.push_back(i.default_block);
          },
          [](const auto&) {},
      },
      insn.data);
  return out;
}

}  // namespace ssair::ir
