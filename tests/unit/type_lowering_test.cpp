#include <gtest/gtest.h>

#include "ssair/ast/type.hpp"
#include "ssair/common/internal_error.hpp"
#include "ssair/common/target.hpp"
#include "ssair/ir/type.hpp"
#include "ssair/lowering/type_lowering.hpp"

namespace ssair::lowering {
namespace {

using AstType = ast::Type;
using Kind = ast::Type::Kind;
using ir::Type;

class TypeLoweringTest : public ::testing::Test {
 protected:
  TypeLoweringTest() {
    ns_.enums.push_back(ast::EnumDecl{.name = "Color", .bits = 8});
    ns_.enums.push_back(ast::EnumDecl{.name = "Wide", .bits = 16});
    ns_.user_types.push_back(
        ast::UserTypeDecl{.name = "Price", .underlying = AstType::Uint(128)});
    ns_.user_types.push_back(ast::UserTypeDecl{
        .name = "Owner", .underlying = AstType::Simple(Kind::kAddress)});
  }

  auto Lowering(common::Target target) const -> TypeLowering {
    return TypeLowering(common::ParamsFor(target), ns_);
  }

  ast::Namespace ns_;
};

// =============================================================================
// Target-dependent scalars
// =============================================================================

TEST_F(TypeLoweringTest, AddressFollowsTarget) {
  EXPECT_EQ(
      Lowering(common::Target::kSolana).Lower(AstType::Simple(Kind::kAddress)),
      Type::Bytes(32));
  EXPECT_EQ(
      Lowering(common::Target::kEvm).Lower(AstType::Simple(Kind::kAddress)),
      Type::Bytes(20));
  EXPECT_EQ(
      Lowering(common::Target::kEvm).Lower(AstType::Contract(0)),
      Type::Bytes(20));
}

TEST_F(TypeLoweringTest, ValueFollowsTarget) {
  auto value = AstType::Simple(Kind::kValue);
  EXPECT_EQ(Lowering(common::Target::kSolana).Lower(value), Type::Uint(64));
  EXPECT_EQ(Lowering(common::Target::kPolkadot).Lower(value), Type::Uint(128));
  EXPECT_EQ(Lowering(common::Target::kEvm).Lower(value), Type::Uint(256));
}

TEST_F(TypeLoweringTest, SelectorFollowsTarget) {
  auto selector = AstType::Simple(Kind::kFunctionSelector);
  EXPECT_EQ(Lowering(common::Target::kSolana).Lower(selector), Type::Uint(64));
  EXPECT_EQ(Lowering(common::Target::kEvm).Lower(selector), Type::Uint(32));
}

// =============================================================================
// Target-independent mapping
// =============================================================================

TEST_F(TypeLoweringTest, Scalars) {
  auto l = Lowering(common::Target::kSolana);
  EXPECT_EQ(l.Lower(AstType::Simple(Kind::kBool)), Type::Bool());
  EXPECT_EQ(l.Lower(AstType::Int(24)), Type::Int(24));
  EXPECT_EQ(l.Lower(AstType::Uint(256)), Type::Uint(256));
  EXPECT_EQ(l.Lower(AstType::Bytes(4)), Type::Bytes(4));
}

TEST_F(TypeLoweringTest, EnumUsesDeclaredWidth) {
  auto l = Lowering(common::Target::kSolana);
  EXPECT_EQ(l.Lower(AstType::Enum(0)), Type::Uint(8));
  EXPECT_EQ(l.Lower(AstType::Enum(1)), Type::Uint(16));
}

TEST_F(TypeLoweringTest, UserTypeLowersItsUnderlyingType) {
  EXPECT_EQ(
      Lowering(common::Target::kSolana).Lower(AstType::UserType(0)),
      Type::Uint(128));
  EXPECT_EQ(
      Lowering(common::Target::kEvm).Lower(AstType::UserType(1)),
      Type::Bytes(20));
}

TEST_F(TypeLoweringTest, StringAndDynamicBytesShareVectorShape) {
  auto l = Lowering(common::Target::kSolana);
  auto expected = Type::Ptr(Type::Struct(ir::StructTag::Vector(Type::Bytes(1))));
  EXPECT_EQ(l.Lower(AstType::Simple(Kind::kString)), expected);
  EXPECT_EQ(l.Lower(AstType::Simple(Kind::kDynamicBytes)), expected);
  EXPECT_EQ(expected.ToString(), "ptr<struct.vector<bytes1>>");
}

TEST_F(TypeLoweringTest, ArrayBecomesPointerToArray) {
  auto src = AstType::Array(
      AstType::Simple(Kind::kBool),
      {ast::ArrayDim{.kind = ast::ArrayDim::Kind::kFixed, .size = 3},
       ast::ArrayDim{.kind = ast::ArrayDim::Kind::kDynamic}});
  auto lowered = Lowering(common::Target::kSolana).Lower(src);
  EXPECT_EQ(lowered.ToString(), "ptr<bool[3][]>");
}

TEST_F(TypeLoweringTest, Structs) {
  auto l = Lowering(common::Target::kSolana);
  EXPECT_EQ(
      l.Lower(AstType::Struct(ast::StructRef{.id = 7})),
      Type::Ptr(Type::Struct(ir::StructTag::UserDefined(7))));
  EXPECT_EQ(
      l.Lower(AstType::Struct(
          ast::StructRef{.kind = ast::StructRef::Kind::kAccountMeta})),
      Type::Ptr(Type::Struct(ir::StructTag::AccountMeta())));
}

TEST_F(TypeLoweringTest, SliceAndBufferPointer) {
  auto l = Lowering(common::Target::kSolana);
  EXPECT_EQ(
      l.Lower(AstType::Slice(AstType::Bytes(1))),
      Type::Ptr(Type::Slice(Type::Bytes(1))));
  EXPECT_EQ(
      l.Lower(AstType::Simple(Kind::kBufferPointer)),
      Type::Ptr(Type::Bytes(1)));
}

TEST_F(TypeLoweringTest, MappingLowersBothSides) {
  auto src = AstType::Mapping(
      AstType::Simple(Kind::kAddress), AstType::Simple(Kind::kString));
  EXPECT_EQ(
      Lowering(common::Target::kEvm).Lower(src).ToString(),
      "mapping<bytes20 -> ptr<struct.vector<bytes1>>>");
}

TEST_F(TypeLoweringTest, References) {
  auto l = Lowering(common::Target::kSolana);
  EXPECT_EQ(l.Lower(AstType::Ref(AstType::Uint(8))), Type::Ptr(Type::Uint(8)));
  EXPECT_EQ(
      l.Lower(AstType::StorageRef(true, AstType::Uint(8))),
      Type::StoragePtr(true, Type::Uint(8)));
  EXPECT_EQ(
      l.Lower(AstType::StorageRef(false, AstType::Uint(8))).ToString(),
      "storage_ptr<uint8>");
}

TEST_F(TypeLoweringTest, FunctionTypes) {
  auto l = Lowering(common::Target::kSolana);
  auto internal = AstType::InternalFunction(
      {AstType::Uint(8), AstType::Simple(Kind::kBool)}, {AstType::Int(32)});
  EXPECT_EQ(l.Lower(internal).ToString(), "ptr<fn(uint8, bool) -> (int32)>");

  auto external = AstType::ExternalFunction({AstType::Uint(8)}, {});
  EXPECT_EQ(
      l.Lower(external),
      Type::Ptr(Type::Struct(ir::StructTag::ExternalFunction())));
}

TEST_F(TypeLoweringTest, IsDeterministic) {
  auto src = AstType::Mapping(
      AstType::Simple(Kind::kValue), AstType::Array(AstType::Enum(1), {}));
  auto l = Lowering(common::Target::kPolkadot);
  EXPECT_EQ(l.Lower(src), l.Lower(src));
}

// =============================================================================
// Unrepresentable types
// =============================================================================

TEST_F(TypeLoweringTest, UnrepresentableTypesThrow) {
  auto l = Lowering(common::Target::kSolana);
  for (auto kind :
       {Kind::kRational, Kind::kVoid, Kind::kUnreachable, Kind::kUnresolved}) {
    EXPECT_THROW((void)l.Lower(AstType::Simple(kind)), common::InternalError)
        << ast::ToString(kind);
  }
}

TEST_F(TypeLoweringTest, DanglingDeclarationsThrow) {
  auto l = Lowering(common::Target::kSolana);
  EXPECT_THROW((void)l.Lower(AstType::Enum(9)), common::InternalError);
  EXPECT_THROW((void)l.Lower(AstType::UserType(9)), common::InternalError);
}

TEST_F(TypeLoweringTest, EmptyNamespaceRejectsDeclarationReferences) {
  ast::Namespace empty;
  TypeLowering l(common::ParamsFor(common::Target::kSolana), empty);
  EXPECT_EQ(l.Lower(AstType::Uint(8)), Type::Uint(8));
  EXPECT_THROW((void)l.Lower(AstType::Enum(0)), common::InternalError);
  EXPECT_THROW((void)l.Lower(AstType::UserType(0)), common::InternalError);
  EXPECT_THROW(
      (void)l.Lower(AstType::Array(AstType::Enum(0), {})),
      common::InternalError);
}

}  // namespace
}  // namespace ssair::lowering
