#include "ssair/ir/operator.hpp"

#include <string>

namespace ssair::ir {

namespace {

auto Symbol(BinaryOpKind kind) -> const char* {
  switch (kind) {
    case BinaryOpKind::kAdd:
      return "+";
    case BinaryOpKind::kSub:
      return "-";
    case BinaryOpKind::kMul:
      return "*";
    case BinaryOpKind::kPow:
      return "**";
    case BinaryOpKind::kDiv:
      return "/";
    case BinaryOpKind::kUDiv:
      return "(u)/";
    case BinaryOpKind::kMod:
      return "%";
    case BinaryOpKind::kUMod:
      return "(u)%";
    case BinaryOpKind::kEq:
      return "==";
    case BinaryOpKind::kNeq:
      return "!=";
    case BinaryOpKind::kLt:
      return "<";
    case BinaryOpKind::kULt:
      return "(u)<";
    case BinaryOpKind::kLte:
      return "<=";
    case BinaryOpKind::kULte:
      return "(u)<=";
    case BinaryOpKind::kGt:
      return ">";
    case BinaryOpKind::kUGt:
      return "(u)>";
    case BinaryOpKind::kGte:
      return ">=";
    case BinaryOpKind::kUGte:
      return "(u)>=";
    case BinaryOpKind::kBitAnd:
      return "&";
    case BinaryOpKind::kBitOr:
      return "|";
    case BinaryOpKind::kBitXor:
      return "^";
    case BinaryOpKind::kShl:
      return "<<";
    case BinaryOpKind::kShr:
      return ">>";
    case BinaryOpKind::kUShr:
      return "(u)>>";
  }
  return "<?>";
}

}  // namespace

auto HasOverflowTag(BinaryOpKind kind) -> bool {
  return kind == BinaryOpKind::kAdd || kind == BinaryOpKind::kSub ||
         kind == BinaryOpKind::kMul || kind == BinaryOpKind::kPow;
}

auto ToString(BinaryOp op) -> std::string {
  std::string out = (op.overflowing && HasOverflowTag(op.kind)) ? "(of)" : "";
  out += Symbol(op.kind);
  return out;
}

auto ToString(UnaryOp op) -> std::string {
  switch (op.kind) {
    case UnaryOpKind::kNot:
      return "!";
    case UnaryOpKind::kNeg:
      return op.overflowing ? "(of)-" : "-";
    case UnaryOpKind::kBitNot:
      return "~";
  }
  return "<?>";
}

}  // namespace ssair::ir
