#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "ssair/common/internal_error.hpp"
#include "ssair/ir/handle.hpp"
#include "ssair/ir/type.hpp"
#include "ssair/ir/vartable.hpp"

namespace ssair::ir {
namespace {

class VarTableTest : public ::testing::Test {
 protected:
  VarTable vars_;
};

TEST_F(VarTableTest, EmptyTable) {
  EXPECT_EQ(vars_.Size(), 0U);
  EXPECT_FALSE(vars_.Contains(VarId{0}));
}

TEST_F(VarTableTest, IdentitiesAreMonotonicFromZero) {
  VarId a = vars_.Declare(Type::Uint(8));
  VarId b = vars_.Declare(Type::Bool(), "flag");
  VarId c = vars_.Declare(Type::Ptr(Type::Int(32)));
  EXPECT_EQ(a.value, 0U);
  EXPECT_EQ(b.value, 1U);
  EXPECT_EQ(c.value, 2U);
  EXPECT_EQ(vars_.Size(), 3U);
}

TEST_F(VarTableTest, TypesAndNamesAreStable) {
  VarId a = vars_.Declare(Type::Uint(8));
  VarId b = vars_.Declare(Type::Bool(), "flag");
  for (int i = 0; i < 10; ++i) {
    vars_.Declare(Type::Int(16));
  }
  EXPECT_EQ(vars_.TypeOf(a), Type::Uint(8));
  EXPECT_EQ(vars_.TypeOf(b), Type::Bool());
  EXPECT_EQ(vars_.NameOf(a), std::nullopt);
  EXPECT_EQ(vars_.NameOf(b), std::optional<std::string>("flag"));
}

TEST_F(VarTableTest, UnknownIdentityThrows) {
  vars_.Declare(Type::Uint(8));
  EXPECT_TRUE(vars_.Contains(VarId{0}));
  EXPECT_FALSE(vars_.Contains(VarId{1}));
  EXPECT_THROW((void)vars_.TypeOf(VarId{1}), common::InternalError);
  EXPECT_THROW((void)vars_.NameOf(VarId{7}), common::InternalError);
}

TEST_F(VarTableTest, IterationFollowsIdentityOrder) {
  vars_.Declare(Type::Uint(8), "x");
  vars_.Declare(Type::Bool());
  vars_.Declare(Type::Bytes(4), "y");

  std::vector<std::string> rendered;
  for (const auto& entry : vars_) {
    rendered.push_back(entry.type.ToString() + ":" + entry.name.value_or("-"));
  }
  EXPECT_EQ(
      rendered, (std::vector<std::string>{"uint8:x", "bool:-", "bytes4:y"}));
}

TEST_F(VarTableTest, MoveKeepsEntries) {
  vars_.Declare(Type::Uint(8), "x");
  VarTable moved = std::move(vars_);
  EXPECT_EQ(moved.Size(), 1U);
  EXPECT_EQ(moved.NameOf(VarId{0}), std::optional<std::string>("x"));
}

}  // namespace
}  // namespace ssair::ir
