#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "ssair/common/integral_constant.hpp"
#include "ssair/ir/handle.hpp"
#include "ssair/ir/operand.hpp"
#include "ssair/ir/operator.hpp"
#include "ssair/ir/type.hpp"

namespace ssair::ir {

// Display specifier attached to each FormatString argument.
enum class FormatArg { kDefault, kBinary, kHex };

auto ToString(FormatArg spec) -> const char*;

// One side of a string compare/concat: either a compile-time byte constant or
// a runtime operand, so constant-folding opportunities stay visible.
struct StringLocation {
  enum class Kind { kCompileTime, kRunTime };

  Kind kind = Kind::kRunTime;
  std::variant<std::vector<uint8_t>, Operand> payload;

  static auto CompileTime(std::vector<uint8_t> bytes) -> StringLocation {
    return {.kind = Kind::kCompileTime, .payload = std::move(bytes)};
  }

  static auto RunTime(Operand operand) -> StringLocation {
    return {.kind = Kind::kRunTime, .payload = std::move(operand)};
  }

  auto operator==(const StringLocation&) const -> bool = default;
};

// Per-variant payloads. Every expression is pure: it reads operands and
// yields a value, with no store and no control transfer.

struct BinaryExpr {
  BinaryOp op;
  Operand left;
  Operand right;
};

struct UnaryExpr {
  UnaryOp op;
  Operand operand;
};

struct NumberLiteralExpr {
  Type type;
  common::IntegralConstant value;
};

struct BoolLiteralExpr {
  bool value = false;
};

struct BytesLiteralExpr {
  Type type;
  std::vector<uint8_t> value;
};

// Built at runtime from its elements.
struct ArrayLiteralExpr {
  Type type;
  std::vector<Operand> values;
};

// Fully constant; later stages may place it in read-only storage.
struct ConstArrayLiteralExpr {
  Type type;
  std::vector<Operand> values;
};

struct StructLiteralExpr {
  Type type;
  std::vector<Operand> values;
};

struct IdExpr {
  VarId id;
};

// Address-of.
struct GetRefExpr {
  Operand operand;
};

// Dereference.
struct LoadExpr {
  Operand operand;
};

struct StructMemberExpr {
  Operand operand;
  uint32_t member = 0;
};

struct SubscriptExpr {
  Operand array;
  Operand index;
};

// Raw pointer arithmetic in bytes.
struct AdvancePointerExpr {
  Operand pointer;
  Operand bytes_offset;
};

struct CastExpr {
  Operand operand;
  Type to;
};

// Fixed-width bytes <-> dynamic bytes. Changes representation (inline bytes
// vs pointer-to-vector), not just the bit pattern.
struct BytesCastExpr {
  Operand operand;
  Type to;
};

struct SignExtExpr {
  Operand operand;
  Type to;
};

struct ZeroExtExpr {
  Operand operand;
  Type to;
};

// Value-preserving only for values that fit; overflow is undefined here and
// guarding it is the emitting pass's job.
struct TruncExpr {
  Operand operand;
  Type to;
};

// type is the pointer to the allocated buffer. The initializer length is not
// checked against size at construction.
struct AllocDynamicBytesExpr {
  Type type;
  Operand size;
  std::optional<std::vector<uint8_t>> initializer;
};

struct Keccak256Expr {
  std::vector<Operand> args;
};

struct StringCompareExpr {
  StringLocation left;
  StringLocation right;
};

struct StringConcatExpr {
  StringLocation left;
  StringLocation right;
};

// Length of a persistent-storage array without loading its elements.
struct StorageArrayLengthExpr {
  Operand array;
};

struct FormatStringExpr {
  std::vector<std::pair<FormatArg, Operand>> args;
};

// The current function's nth parameter.
struct FunctionArgExpr {
  Type type;
  uint32_t index = 0;
};

// Another function used as a first-class value.
struct InternalFunctionCfgExpr {
  FunctionId function;
};

// Data returned by the most recent external call.
struct ReturnDataExpr {};

using ExpressionData = std::variant<
    BinaryExpr, UnaryExpr, NumberLiteralExpr, BoolLiteralExpr,
    BytesLiteralExpr, ArrayLiteralExpr, ConstArrayLiteralExpr,
    StructLiteralExpr, IdExpr, GetRefExpr, LoadExpr, StructMemberExpr,
    SubscriptExpr, AdvancePointerExpr, CastExpr, BytesCastExpr, SignExtExpr,
    ZeroExtExpr, TruncExpr, AllocDynamicBytesExpr, Keccak256Expr,
    StringCompareExpr, StringConcatExpr, StorageArrayLengthExpr,
    FormatStringExpr, FunctionArgExpr, InternalFunctionCfgExpr,
    ReturnDataExpr>;

struct Expression {
  ExpressionData data;
};

// Every operand an expression reads, in field order. Compile-time string
// sides contribute nothing.
auto CollectOperands(const Expression& expr) -> std::vector<const Operand*>;

}  // namespace ssair::ir
