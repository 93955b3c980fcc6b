#pragma once

#include <vector>

#include "ssair/ast/type.hpp"
#include "ssair/common/target.hpp"
#include "ssair/ir/type.hpp"

namespace ssair::lowering {

// Maps source types onto IR types for one compilation unit. Deterministic
// for a fixed target: address, value and selector widths come from
// `params`, enum widths and user-type aliases from `ns`.
class TypeLowering {
 public:
  // `ns` must outlive the lowering.
  TypeLowering(common::TargetParams params, const ast::Namespace& ns);
  TypeLowering(common::TargetParams params, ast::Namespace&& ns) = delete;

  // Throws InternalError for types with no runtime representation
  // (rational, void, unreachable, unresolved) and for dangling declaration
  // references.
  [[nodiscard]] auto Lower(const ast::Type& type) const -> ir::Type;

  [[nodiscard]] auto Params() const -> const common::TargetParams& {
    return params_;
  }

 private:
  [[nodiscard]] auto LowerAll(const std::vector<ast::Type>& types) const
      -> std::vector<ir::Type>;
  [[nodiscard]] auto LowerStruct(const ast::StructRef& ref) const
      -> ir::StructTag;

  common::TargetParams params_;
  const ast::Namespace& ns_;
};

}  // namespace ssair::lowering
