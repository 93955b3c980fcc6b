#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ssair::common {

// Platform the compilation unit is lowered for. Fixed once per unit.
enum class Target { kSolana, kPolkadot, kEvm };

// Size parameters a target imposes on lowered types, in bytes.
struct TargetParams {
  uint16_t address_length = 32;
  uint16_t value_length = 8;
  uint16_t selector_length = 8;

  auto operator==(const TargetParams&) const -> bool = default;
};

auto ParamsFor(Target target) -> TargetParams;

// Accepts "solana", "polkadot" and "evm".
auto ParseTarget(std::string_view name) -> std::optional<Target>;

auto ToString(Target target) -> const char*;

}  // namespace ssair::common
