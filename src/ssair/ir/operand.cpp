#include "ssair/ir/operand.hpp"

#include <string>
#include <variant>

#include <fmt/core.h>

#include "ssair/common/internal_error.hpp"

namespace ssair::ir {

auto Operand::AsVar() const -> VarId {
  if (kind != Kind::kId) {
    throw common::InternalError(
        "Operand::AsVar",
        fmt::format("operand {} is not a variable", ToString()));
  }
  return std::get<VarId>(payload);
}

auto Operand::AsNumber() const -> const NumberConstant& {
  if (kind != Kind::kNumberLiteral) {
    throw common::InternalError(
        "Operand::AsNumber",
        fmt::format("operand {} is not a number literal", ToString()));
  }
  return std::get<NumberConstant>(payload);
}

auto Operand::ToString() const -> std::string {
  switch (kind) {
    case Kind::kId:
      return fmt::format("%{}", std::get<VarId>(payload).value);
    case Kind::kBoolLiteral:
      return std::get<bool>(payload) ? "true" : "false";
    case Kind::kNumberLiteral: {
      const auto& num = std::get<NumberConstant>(payload);
      return fmt::format("{}({})", num.type.ToString(), num.value.ToString());
    }
  }
  return "<?>";
}

}  // namespace ssair::ir
