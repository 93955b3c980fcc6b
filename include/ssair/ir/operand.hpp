#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "ssair/common/integral_constant.hpp"
#include "ssair/ir/handle.hpp"
#include "ssair/ir/type.hpp"

namespace ssair::ir {

// A typed number constant: the type decides both width and printed form.
struct NumberConstant {
  Type type;
  common::IntegralConstant value;

  auto operator==(const NumberConstant&) const -> bool = default;
};

using OperandPayload = std::variant<VarId, bool, NumberConstant>;

// Reference to a value usable inside an expression or instruction.
// Operands are immutable once constructed. A kId operand is a lookup into the
// function's VarTable, never an owner.
struct Operand {
  enum class Kind {
    kId,             // read of an SSA variable
    kBoolLiteral,    // true / false
    kNumberLiteral,  // typed integer constant
  };

  Kind kind = Kind::kId;
  OperandPayload payload;

  static auto Id(VarId id) -> Operand {
    return {.kind = Kind::kId, .payload = id};
  }

  static auto Bool(bool value) -> Operand {
    return {.kind = Kind::kBoolLiteral, .payload = value};
  }

  static auto Number(Type type, common::IntegralConstant value) -> Operand {
    return {
        .kind = Kind::kNumberLiteral,
        .payload = NumberConstant{
            .type = std::move(type), .value = std::move(value)}};
  }

  static auto Number(Type type, int64_t value) -> Operand {
    return Number(std::move(type), common::IntegralConstant::FromInt64(value));
  }

  [[nodiscard]] auto IsId() const -> bool {
    return kind == Kind::kId;
  }

  [[nodiscard]] auto IsLiteral() const -> bool {
    return kind != Kind::kId;
  }

  // Throws InternalError unless kind == kId.
  [[nodiscard]] auto AsVar() const -> VarId;

  // Throws InternalError unless kind == kNumberLiteral.
  [[nodiscard]] auto AsNumber() const -> const NumberConstant&;

  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const Operand&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const Operand& op) -> std::ostream& {
  return os << op.ToString();
}

}  // namespace ssair::ir

template <>
struct fmt::formatter<ssair::ir::Operand> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const ssair::ir::Operand& op, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", op.ToString());
  }
};
