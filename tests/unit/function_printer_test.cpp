#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "ssair/common/internal_error.hpp"
#include "ssair/ir/builder.hpp"
#include "ssair/ir/expression.hpp"
#include "ssair/ir/function.hpp"
#include "ssair/ir/instruction.hpp"
#include "ssair/ir/operator.hpp"
#include "ssair/ir/printer.hpp"
#include "ssair/ir/type.hpp"

namespace ssair::ir {
namespace {

// Builds:
//   fn max(uint8 a, uint8 b) -> uint8 { return a > b ? a : b; }
auto BuildMax() -> Function {
  FunctionBuilder b(
      FunctionId{2}, "max", {Type::Uint(8), Type::Uint(8)}, {Type::Uint(8)});
  BlockId entry = b.NewBlock("entry");
  BlockId take_a = b.NewBlock("take_a");
  BlockId join = b.NewBlock("join");

  b.SetInsertBlock(entry);
  VarId a = b.EmitSet(
      Type::Uint(8), Expression{FunctionArgExpr{.type = Type::Uint(8)}}, "a");
  VarId bv = b.EmitSet(
      Type::Uint(8),
      Expression{FunctionArgExpr{.type = Type::Uint(8), .index = 1}}, "b");
  VarId gt = b.EmitSet(
      Type::Bool(), Expression{BinaryExpr{
                        .op = {BinaryOpKind::kUGt},
                        .left = Operand::Id(a),
                        .right = Operand::Id(bv)}});
  b.Emit(Instruction{BranchCond{
      .cond = Operand::Id(gt), .true_block = take_a, .false_block = join}});

  b.SetInsertBlock(take_a);
  b.Emit(Instruction{Branch{join}});

  b.SetInsertBlock(join);
  VarId result = b.DeclareVar(Type::Uint(8), "result");
  b.Emit(Instruction{Phi{
      .result = result,
      .inputs = {
          {.operand = Operand::Id(a), .block = take_a},
          {.operand = Operand::Id(bv), .block = entry}}}});
  b.Emit(Instruction{Return{{Operand::Id(result)}}});

  return b.Finish(entry);
}

TEST(FunctionPrinterTest, WholeFunctionDump) {
  Function func = BuildMax();
  std::ostringstream out;
  PrintFunction(func, out);
  EXPECT_EQ(
      out.str(),
      "function#2 max (uint8, uint8) -> (uint8):\n"
      "  vars:\n"
      "    %0: uint8 a\n"
      "    %1: uint8 b\n"
      "    %2: bool\n"
      "    %3: uint8 result\n"
      "  block#0: entry\n"
      "    %0 = arg#0;\n"
      "    %1 = arg#1;\n"
      "    %2 = %0 (u)> %1;\n"
      "    cbr %2 block#1 else block#2;\n"
      "  block#1: take_a\n"
      "    br block#2;\n"
      "  block#2: join\n"
      "    %3 = phi [%0, block#1], [%1, block#0];\n"
      "    return %3;\n");
}

TEST(FunctionPrinterTest, DumpIsDeterministic) {
  Function func = BuildMax();
  std::ostringstream first;
  std::ostringstream second;
  PrintFunction(func, first);
  PrintFunction(func, second);
  EXPECT_EQ(first.str(), second.str());
}

TEST(FunctionPrinterTest, EmptySignature) {
  FunctionBuilder b(FunctionId{0}, "noop", {}, {});
  BlockId entry = b.NewBlock("entry");
  b.SetInsertBlock(entry);
  b.Emit(Instruction{Return{}});
  Function func = b.Finish(entry);

  std::ostringstream out;
  PrintFunction(func, out);
  EXPECT_EQ(
      out.str(),
      "function#0 noop () -> ():\n"
      "  vars:\n"
      "  block#0: entry\n"
      "    return;\n");
}

TEST(FunctionPrinterTest, ForeignVariableTableIsRejected) {
  Function func = BuildMax();
  VarTable other;
  std::ostringstream out;
  Printer printer(&other, &out);
  EXPECT_THROW(printer.Print(func), common::InternalError);
}

TEST(FunctionPrinterTest, FailedDumpLeavesIndentUnchanged) {
  Function func = BuildMax();
  std::ostringstream expected;
  PrintFunction(func, expected);

  // An undeclared variable makes the dump throw inside the join block.
  auto& join = func.blocks[2].instructions;
  join.insert(
      join.begin(),
      Instruction{ir::Print{.operand = Operand::Id(VarId{99})}});

  std::ostringstream out;
  Printer printer(&func.vars, &out);
  EXPECT_THROW(printer.Print(func), common::InternalError);
  EXPECT_THROW(
      printer.PrintBlock(func.blocks[2], BlockId{2}), common::InternalError);

  join.erase(join.begin());
  out.str("");
  printer.Print(func);
  EXPECT_EQ(out.str(), expected.str());
}

}  // namespace
}  // namespace ssair::ir
