#include "ssair/ir/expression.hpp"

#include <variant>
#include <vector>

#include "ssair/common/overloaded.hpp"

namespace ssair::ir {

namespace {

void CollectString(
    const StringLocation& loc, std::vector<const Operand*>& out) {
  if (const auto* op = std::get_if<Operand>(&loc.payload)) {
    out.push_back(op);
  }
}

void CollectAll(
    const std::vector<Operand>& ops, std::vector<const Operand*>& out) {
  for (const auto& op : ops) {
    out.push_back(&op);
  }
}

}  // namespace

auto ToString(FormatArg spec) -> const char* {
  switch (spec) {
    case FormatArg::kDefault:
      return "";
    case FormatArg::kBinary:
      return ":b";
    case FormatArg::kHex:
      return ":x";
  }
  return "";
}

auto CollectOperands(const Expression& expr) -> std::vector<const Operand*> {
  std::vector<const Operand*> out;
  std::visit(
      Overloaded{
          [&](const BinaryExpr& e) {
            out.push_back(&e.left);
            out.push_back(&e.right);
          },
          [&](const UnaryExpr& e) { out.push_back(&e.operand); },
          [](const NumberLiteralExpr&) {},
          [](const BoolLiteralExpr&) {},
          [](const BytesLiteralExpr&) {},
          [&](const ArrayLiteralExpr& e) { CollectAll(e.values, out); },
          [&](const ConstArrayLiteralExpr& e) { CollectAll(e.values, out); },
          [&](const StructLiteralExpr& e) { CollectAll(e.values, out); },
          // IdExpr names its variable directly; callers check it separately.
          [](const IdExpr&) {},
          [&](const GetRefExpr& e) { out.push_back(&e.operand); },
          [&](const LoadExpr& e) { out.push_back(&e.operand); },
          [&](const StructMemberExpr& e) { out.push_back(&e.operand); },
          [&](const SubscriptExpr& e) {
            out.push_back(&e.array);
            out.push_back(&e.index);
          },
          [&](const AdvancePointerExpr& e) {
            out.push_back(&e.pointer);
            out.push_back(&e.bytes_offset);
          },
          [&](const CastExpr& e) { out.push_back(&e.operand); },
          [&](const BytesCastExpr& e) { out.push_back(&e.operand); },
          [&](const SignExtExpr& e) { out.push_back(&e.operand); },
          [&](const ZeroExtExpr& e) { out.push_back(&e.operand); },
          [&](const TruncExpr& e) { out.push_back(&e.operand); },
          [&](const AllocDynamicBytesExpr& e) { out.push_back(&e.size); },
          [&](const Keccak256Expr& e) { CollectAll(e.args, out); },
          [&](const StringCompareExpr& e) {
            CollectString(e.left, out);
            CollectString(e.right, out);
          },
          [&](const StringConcatExpr& e) {
            CollectString(e.left, out);
            CollectString(e.right, out);
          },
          [&](const StorageArrayLengthExpr& e) { out.push_back(&e.array); },
          [&](const FormatStringExpr& e) {
            for (const auto& [spec, arg] : e.args) {
              out.push_back(&arg);
            }
          },
          [](const FunctionArgExpr&) {},
          [](const InternalFunctionCfgExpr&) {},
          [](const ReturnDataExpr&) {},
      },
      expr.data);
  return out;
}

}  // namespace ssair::ir
