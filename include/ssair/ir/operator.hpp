#pragma once

#include <string>

namespace ssair::ir {

// Unsigned variants carry the `U` prefix; the unprefixed form is signed where
// signedness matters.
enum class BinaryOpKind {
  // Arithmetic (overflow-checkable)
  kAdd,
  kSub,
  kMul,
  kPow,

  // Division
  kDiv,
  kUDiv,
  kMod,
  kUMod,

  // Comparison
  kEq,
  kNeq,
  kLt,
  kULt,
  kLte,
  kULte,
  kGt,
  kUGt,
  kGte,
  kUGte,

  // Bitwise
  kBitAnd,
  kBitOr,
  kBitXor,

  // Shift
  kShl,
  kShr,
  kUShr,
};

// overflowing = true marks a checked operation; only kAdd, kSub, kMul and
// kPow carry the tag.
struct BinaryOp {
  BinaryOpKind kind = BinaryOpKind::kAdd;
  bool overflowing = false;

  auto operator==(const BinaryOp&) const -> bool = default;
};

enum class UnaryOpKind {
  kNot,
  kNeg,
  kBitNot,
};

struct UnaryOp {
  UnaryOpKind kind = UnaryOpKind::kNot;
  bool overflowing = false;  // kNeg only

  auto operator==(const UnaryOp&) const -> bool = default;
};

[[nodiscard]] auto HasOverflowTag(BinaryOpKind kind) -> bool;

auto ToString(BinaryOp op) -> std::string;
auto ToString(UnaryOp op) -> std::string;

}  // namespace ssair::ir
