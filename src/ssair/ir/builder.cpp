#include "ssair/ir/builder.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ssair/common/internal_error.hpp"
#include "ssair/ir/verify.hpp"

namespace ssair::ir {

FunctionBuilder::FunctionBuilder(
    FunctionId id, std::string name, std::vector<Type> params,
    std::vector<Type> returns) {
  func_.id = id;
  func_.name = std::move(name);
  func_.params = std::move(params);
  func_.returns = std::move(returns);
}

void FunctionBuilder::CheckLive(const char* op) const {
  if (finished_) {
    throw common::InternalError(
        op, fmt::format("builder for {} already finished", func_.name));
  }
}

auto FunctionBuilder::NewBlock(std::string name) -> BlockId {
  CheckLive("FunctionBuilder::NewBlock");
  BlockId id{static_cast<uint32_t>(func_.blocks.size())};
  spdlog::debug("{}: new block#{} {}", func_.name, id.value, name);
  func_.blocks.push_back(BasicBlock{.name = std::move(name)});
  return id;
}

void FunctionBuilder::SetInsertBlock(BlockId block) {
  CheckLive("FunctionBuilder::SetInsertBlock");
  if (block.value >= func_.blocks.size()) {
    throw common::InternalError(
        "FunctionBuilder::SetInsertBlock",
        fmt::format(
            "block#{} out of range ({} blocks)", block.value,
            func_.blocks.size()));
  }
  current_ = block;
}

auto FunctionBuilder::CurrentBlock() const -> BlockId {
  if (!current_) {
    throw common::InternalError(
        "FunctionBuilder::CurrentBlock", "no insert block set");
  }
  return *current_;
}

auto FunctionBuilder::DeclareVar(Type type, std::optional<std::string> name)
    -> VarId {
  CheckLive("FunctionBuilder::DeclareVar");
  return func_.vars.Declare(std::move(type), std::move(name));
}

void FunctionBuilder::Emit(Instruction insn) {
  CheckLive("FunctionBuilder::Emit");
  BlockId block = CurrentBlock();
  auto& insns = func_.blocks[block.value].instructions;
  if (!insns.empty() && IsTerminator(insns.back())) {
    throw common::InternalError(
        "FunctionBuilder::Emit",
        fmt::format(
            "{}: block#{} already terminated", func_.name, block.value));
  }
  if (IsPhi(insn) && !insns.empty() && !IsPhi(insns.back())) {
    throw common::InternalError(
        "FunctionBuilder::Emit",
        fmt::format(
            "{}: phi after non-phi in block#{}", func_.name, block.value));
  }
  insns.push_back(std::move(insn));
}

auto FunctionBuilder::EmitSet(
    Type type, Expression expr, std::optional<std::string> name) -> VarId {
  VarId result = DeclareVar(std::move(type), std::move(name));
  Emit(Instruction{Set{.result = result, .expr = std::move(expr)}});
  return result;
}

auto FunctionBuilder::Finish(BlockId entry) -> Function {
  CheckLive("FunctionBuilder::Finish");
  func_.entry = entry;
  VerifyFunction(func_, func_.name);
  finished_ = true;
  return std::move(func_);
}

}  // namespace ssair::ir
