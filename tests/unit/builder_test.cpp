#include <optional>
#include <string>
#include <variant>

#include <gtest/gtest.h>

#include "ssair/common/internal_error.hpp"
#include "ssair/ir/builder.hpp"
#include "ssair/ir/expression.hpp"
#include "ssair/ir/function.hpp"
#include "ssair/ir/instruction.hpp"
#include "ssair/ir/type.hpp"

namespace ssair::ir {
namespace {

class FunctionBuilderTest : public ::testing::Test {
 protected:
  FunctionBuilderTest()
      : builder_(FunctionId{1}, "f", {Type::Uint(8)}, {Type::Uint(8)}) {
  }

  FunctionBuilder builder_;
};

TEST_F(FunctionBuilderTest, BlocksAreNumberedInCreationOrder) {
  EXPECT_EQ(builder_.NewBlock("a").value, 0U);
  EXPECT_EQ(builder_.NewBlock("b").value, 1U);
  EXPECT_EQ(builder_.NewBlock("c").value, 2U);
}

TEST_F(FunctionBuilderTest, EmitSetDeclaresAndBinds) {
  BlockId entry = builder_.NewBlock("entry");
  builder_.SetInsertBlock(entry);
  VarId x = builder_.EmitSet(
      Type::Uint(8), Expression{FunctionArgExpr{.type = Type::Uint(8)}}, "x");
  builder_.Emit(Instruction{Return{{Operand::Id(x)}}});

  Function func = builder_.Finish(entry);
  EXPECT_EQ(func.id, FunctionId{1});
  EXPECT_EQ(func.name, "f");
  EXPECT_EQ(func.vars.TypeOf(x), Type::Uint(8));
  EXPECT_EQ(func.vars.NameOf(x), std::optional<std::string>("x"));
  ASSERT_EQ(func.blocks.size(), 1U);
  ASSERT_EQ(func.blocks[0].instructions.size(), 2U);
  const auto* set = std::get_if<Set>(&func.blocks[0].instructions[0].data);
  ASSERT_NE(set, nullptr);
  EXPECT_EQ(set->result, x);
}

TEST_F(FunctionBuilderTest, EmitWithoutInsertBlockThrows) {
  builder_.NewBlock("entry");
  EXPECT_THROW(builder_.Emit(Instruction{Nop{}}), common::InternalError);
}

TEST_F(FunctionBuilderTest, SetInsertBlockOutOfRangeThrows) {
  builder_.NewBlock("entry");
  EXPECT_THROW(builder_.SetInsertBlock(BlockId{3}), common::InternalError);
}

TEST_F(FunctionBuilderTest, EmitAfterTerminatorThrows) {
  BlockId entry = builder_.NewBlock("entry");
  builder_.SetInsertBlock(entry);
  builder_.Emit(Instruction{Unimplemented{.reachable = false}});
  EXPECT_THROW(builder_.Emit(Instruction{Nop{}}), common::InternalError);
}

TEST_F(FunctionBuilderTest, PhiAfterNonPhiThrows) {
  BlockId entry = builder_.NewBlock("entry");
  builder_.SetInsertBlock(entry);
  builder_.Emit(Instruction{Nop{}});
  VarId p = builder_.DeclareVar(Type::Uint(8));
  EXPECT_THROW(
      builder_.Emit(Instruction{Phi{.result = p}}), common::InternalError);
}

TEST_F(FunctionBuilderTest, FinishRunsVerifier) {
  BlockId entry = builder_.NewBlock("entry");
  builder_.SetInsertBlock(entry);
  builder_.Emit(Instruction{Nop{}});
  EXPECT_THROW((void)builder_.Finish(entry), common::InternalError);
}

TEST_F(FunctionBuilderTest, BuilderIsSpentAfterFinish) {
  BlockId entry = builder_.NewBlock("entry");
  builder_.SetInsertBlock(entry);
  builder_.Emit(Instruction{Return{}});
  (void)builder_.Finish(entry);
  EXPECT_THROW(builder_.NewBlock("late"), common::InternalError);
  EXPECT_THROW((void)builder_.Finish(entry), common::InternalError);
}

}  // namespace
}  // namespace ssair::ir
