#include "ssair/ir/vartable.hpp"

#include <fmt/core.h>

#include "ssair/common/internal_error.hpp"

namespace ssair::ir {

auto VarTable::At(VarId id) const -> const Entry& {
  if (!Contains(id)) {
    throw common::InternalError(
        "VarTable",
        fmt::format(
            "unknown variable %{} (table holds {})", id.value,
            entries_.size()));
  }
  return entries_[id.value];
}

auto VarTable::TypeOf(VarId id) const -> const Type& {
  return At(id).type;
}

auto VarTable::NameOf(VarId id) const -> const std::optional<std::string>& {
  return At(id).name;
}

}  // namespace ssair::ir
