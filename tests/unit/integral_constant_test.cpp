#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "ssair/common/integral_constant.hpp"
#include "ssair/common/internal_error.hpp"

namespace ssair::common {
namespace {

class IntegralConstantTest : public ::testing::Test {};

// =============================================================================
// Construction
// =============================================================================

TEST_F(IntegralConstantTest, ZeroIsNeverNegative) {
  auto zero = IntegralConstant::FromInt64(0);
  EXPECT_TRUE(zero.IsZero());
  EXPECT_FALSE(zero.negative);
  EXPECT_EQ(zero, IntegralConstant::FromDecimal("-0"));
  EXPECT_EQ(zero.ToString(), "0");
}

TEST_F(IntegralConstantTest, FromInt64Negative) {
  auto c = IntegralConstant::FromInt64(-42);
  EXPECT_TRUE(c.negative);
  EXPECT_EQ(c.ToString(), "-42");
}

TEST_F(IntegralConstantTest, FromInt64Min) {
  auto c = IntegralConstant::FromInt64(std::numeric_limits<int64_t>::min());
  EXPECT_EQ(c.ToString(), "-9223372036854775808");
}

TEST_F(IntegralConstantTest, FromUint64Max) {
  auto c = IntegralConstant::FromUint64(std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(c.ToString(), "18446744073709551615");
  EXPECT_EQ(c.BitLength(), 64U);
}

TEST_F(IntegralConstantTest, DecimalMatchesInt64) {
  EXPECT_EQ(
      IntegralConstant::FromDecimal("13445566"),
      IntegralConstant::FromInt64(13445566));
  EXPECT_EQ(
      IntegralConstant::FromDecimal("-7"), IntegralConstant::FromInt64(-7));
}

// =============================================================================
// Wide values
// =============================================================================

TEST_F(IntegralConstantTest, Uint256MaxRoundTripsThroughDecimal) {
  constexpr const char* kMax =
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935";
  auto c = IntegralConstant::FromDecimal(kMax);
  EXPECT_EQ(c.words.size(), 4U);
  EXPECT_EQ(c.BitLength(), 256U);
  EXPECT_EQ(c.ToString(), kMax);
}

TEST_F(IntegralConstantTest, TwoToThe64) {
  auto c = IntegralConstant::FromDecimal("18446744073709551616");
  ASSERT_EQ(c.words.size(), 2U);
  EXPECT_EQ(c.words[0], 0U);
  EXPECT_EQ(c.words[1], 1U);
  EXPECT_EQ(c.BitLength(), 65U);
}

TEST_F(IntegralConstantTest, InnerZeroChunksArePadded) {
  EXPECT_EQ(
      IntegralConstant::FromDecimal("1000000000000000001").ToString(),
      "1000000000000000001");
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(IntegralConstantTest, RejectsNonDecimal) {
  EXPECT_THROW(IntegralConstant::FromDecimal(""), InternalError);
  EXPECT_THROW(IntegralConstant::FromDecimal("-"), InternalError);
  EXPECT_THROW(IntegralConstant::FromDecimal("0x10"), InternalError);
  EXPECT_THROW(IntegralConstant::FromDecimal("12a"), InternalError);
}

}  // namespace
}  // namespace ssair::common
