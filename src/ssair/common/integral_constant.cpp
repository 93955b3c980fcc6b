#include "ssair/common/integral_constant.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "ssair/common/internal_error.hpp"

namespace ssair::common {

namespace {

constexpr uint32_t kDecimalChunk = 1'000'000'000;
constexpr int kDecimalChunkDigits = 9;

void Normalize(IntegralConstant& c) {
  while (!c.words.empty() && c.words.back() == 0) {
    c.words.pop_back();
  }
  if (c.words.empty()) {
    c.negative = false;
  }
}

// words = words * mul + add
void MulAddSmall(std::vector<uint64_t>& words, uint32_t mul, uint32_t add) {
  uint64_t carry = add;
  for (auto& word : words) {
    uint64_t lo = (word & 0xFFFFFFFFULL) * mul + carry;
    uint64_t hi = (word >> 32) * mul + (lo >> 32);
    word = (lo & 0xFFFFFFFFULL) | (hi << 32);
    carry = hi >> 32;
  }
  if (carry != 0) {
    words.push_back(carry);
  }
}

// words = words / div, returns remainder
auto DivModSmall(std::vector<uint64_t>& words, uint32_t div) -> uint32_t {
  uint64_t rem = 0;
  for (size_t i = words.size(); i-- > 0;) {
    uint64_t hi = (rem << 32) | (words[i] >> 32);
    uint64_t q_hi = hi / div;
    rem = hi % div;
    uint64_t lo = (rem << 32) | (words[i] & 0xFFFFFFFFULL);
    uint64_t q_lo = lo / div;
    rem = lo % div;
    words[i] = (q_hi << 32) | q_lo;
  }
  while (!words.empty() && words.back() == 0) {
    words.pop_back();
  }
  return static_cast<uint32_t>(rem);
}

}  // namespace

auto IntegralConstant::FromInt64(int64_t v) -> IntegralConstant {
  IntegralConstant c;
  if (v < 0) {
    c.negative = true;
    // Two's complement negation in unsigned arithmetic keeps INT64_MIN exact.
    c.words.push_back(~static_cast<uint64_t>(v) + 1);
  } else {
    c.words.push_back(static_cast<uint64_t>(v));
  }
  Normalize(c);
  return c;
}

auto IntegralConstant::FromUint64(uint64_t v) -> IntegralConstant {
  IntegralConstant c;
  c.words.push_back(v);
  Normalize(c);
  return c;
}

auto IntegralConstant::FromDecimal(std::string_view text) -> IntegralConstant {
  IntegralConstant c;
  std::string_view digits = text;
  if (!digits.empty() && digits.front() == '-') {
    c.negative = true;
    digits.remove_prefix(1);
  }
  if (digits.empty()) {
    throw InternalError(
        "IntegralConstant::FromDecimal",
        fmt::format("'{}' is not a decimal integer", text));
  }
  for (char ch : digits) {
    if (ch < '0' || ch > '9') {
      throw InternalError(
          "IntegralConstant::FromDecimal",
          fmt::format("'{}' is not a decimal integer", text));
    }
    MulAddSmall(c.words, 10, static_cast<uint32_t>(ch - '0'));
  }
  Normalize(c);
  return c;
}

auto IntegralConstant::BitLength() const -> uint32_t {
  if (words.empty()) {
    return 0;
  }
  return static_cast<uint32_t>(
      (words.size() - 1) * 64 + (64 - std::countl_zero(words.back())));
}

auto IntegralConstant::ToString() const -> std::string {
  if (words.empty()) {
    return "0";
  }

  std::vector<uint64_t> magnitude = words;
  std::vector<uint32_t> chunks;
  while (!magnitude.empty()) {
    chunks.push_back(DivModSmall(magnitude, kDecimalChunk));
  }

  std::string out = negative ? "-" : "";
  out += fmt::format("{}", chunks.back());
  for (size_t i = chunks.size() - 1; i-- > 0;) {
    out += fmt::format("{:0{}}", chunks[i], kDecimalChunkDigits);
  }
  return out;
}

}  // namespace ssair::common
