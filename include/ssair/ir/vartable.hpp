#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ssair/ir/handle.hpp"
#include "ssair/ir/type.hpp"

namespace ssair::ir {

// Per-function arena of SSA variables. Append-only: an identity, once
// handed out, keeps its type and name for the life of the table.
class VarTable final {
 public:
  struct Entry {
    Type type;
    std::optional<std::string> name;
  };

  VarTable() = default;
  ~VarTable() = default;

  VarTable(const VarTable&) = delete;
  auto operator=(const VarTable&) -> VarTable& = delete;

  VarTable(VarTable&&) = default;
  auto operator=(VarTable&&) -> VarTable& = default;

  auto Declare(Type type, std::optional<std::string> name = std::nullopt)
      -> VarId {
    VarId id{static_cast<uint32_t>(entries_.size())};
    entries_.push_back(Entry{.type = std::move(type), .name = std::move(name)});
    return id;
  }

  // Throws InternalError for an identity this table never issued.
  [[nodiscard]] auto TypeOf(VarId id) const -> const Type&;
  [[nodiscard]] auto NameOf(VarId id) const -> const std::optional<std::string>&;

  [[nodiscard]] auto Contains(VarId id) const -> bool {
    return id.value < entries_.size();
  }

  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

  // Entries in identity order: the nth entry describes VarId{n}.
  [[nodiscard]] auto begin() const {
    return entries_.begin();
  }

  [[nodiscard]] auto end() const {
    return entries_.end();
  }

 private:
  [[nodiscard]] auto At(VarId id) const -> const Entry&;

  std::vector<Entry> entries_;
};

}  // namespace ssair::ir
