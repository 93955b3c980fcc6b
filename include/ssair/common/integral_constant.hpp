#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ssair::common {

// Arbitrary-precision signed integer used as the value of number literals.
// Magnitude is stored as little-endian 64-bit words with no trailing zero
// words; zero is never negative.
struct IntegralConstant {
  std::vector<uint64_t> words;
  bool negative = false;

  static auto FromInt64(int64_t v) -> IntegralConstant;
  static auto FromUint64(uint64_t v) -> IntegralConstant;

  // Parses an optionally '-'-prefixed decimal string. Throws InternalError
  // on anything else: literal text reaching this layer was already checked.
  static auto FromDecimal(std::string_view text) -> IntegralConstant;

  [[nodiscard]] auto IsZero() const -> bool {
    return words.empty();
  }

  // Number of significant bits in the magnitude.
  [[nodiscard]] auto BitLength() const -> uint32_t;

  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const IntegralConstant&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const IntegralConstant& c) -> H {
    return H::combine(std::move(h), c.words, c.negative);
  }
};

}  // namespace ssair::common
