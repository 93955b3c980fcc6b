#include "ssair/common/target.hpp"

#include <optional>
#include <string_view>

namespace ssair::common {

auto ParamsFor(Target target) -> TargetParams {
  switch (target) {
    case Target::kSolana:
      return TargetParams{
          .address_length = 32, .value_length = 8, .selector_length = 8};
    case Target::kPolkadot:
      return TargetParams{
          .address_length = 32, .value_length = 16, .selector_length = 4};
    case Target::kEvm:
      return TargetParams{
          .address_length = 20, .value_length = 32, .selector_length = 4};
  }
  return TargetParams{};
}

auto ParseTarget(std::string_view name) -> std::optional<Target> {
  if (name == "solana") {
    return Target::kSolana;
  }
  if (name == "polkadot") {
    return Target::kPolkadot;
  }
  if (name == "evm") {
    return Target::kEvm;
  }
  return std::nullopt;
}

auto ToString(Target target) -> const char* {
  switch (target) {
    case Target::kSolana:
      return "solana";
    case Target::kPolkadot:
      return "polkadot";
    case Target::kEvm:
      return "evm";
  }
  return "unknown";
}

}  // namespace ssair::common
