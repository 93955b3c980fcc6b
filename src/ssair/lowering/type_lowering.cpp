#include "ssair/lowering/type_lowering.hpp"

#include <cstdint>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ssair/common/internal_error.hpp"

namespace ssair::lowering {

namespace {

auto LowerDims(const std::vector<ast::ArrayDim>& dims)
    -> std::vector<ir::ArrayLength> {
  std::vector<ir::ArrayLength> out;
  out.reserve(dims.size());
  for (const auto& dim : dims) {
    switch (dim.kind) {
      case ast::ArrayDim::Kind::kFixed:
        out.push_back(ir::ArrayLength::Fixed(dim.size));
        break;
      case ast::ArrayDim::Kind::kDynamic:
        out.push_back(ir::ArrayLength::Dynamic());
        break;
      case ast::ArrayDim::Kind::kAnyFixed:
        out.push_back(ir::ArrayLength::AnyFixed());
        break;
    }
  }
  return out;
}

auto DynamicBytes() -> ir::Type {
  return ir::Type::Ptr(
      ir::Type::Struct(ir::StructTag::Vector(ir::Type::Bytes(1))));
}

}  // namespace

TypeLowering::TypeLowering(
    common::TargetParams params, const ast::Namespace& ns)
    : params_(params), ns_(ns) {
}

auto TypeLowering::LowerAll(const std::vector<ast::Type>& types) const
    -> std::vector<ir::Type> {
  std::vector<ir::Type> out;
  out.reserve(types.size());
  for (const auto& t : types) {
    out.push_back(Lower(t));
  }
  return out;
}

auto TypeLowering::LowerStruct(const ast::StructRef& ref) const
    -> ir::StructTag {
  switch (ref.kind) {
    case ast::StructRef::Kind::kUserDefined:
      return ir::StructTag::UserDefined(ref.id);
    case ast::StructRef::Kind::kAccountInfo:
      return ir::StructTag::AccountInfo();
    case ast::StructRef::Kind::kAccountMeta:
      return ir::StructTag::AccountMeta();
    case ast::StructRef::Kind::kExternalFunction:
      return ir::StructTag::ExternalFunction();
    case ast::StructRef::Kind::kParameters:
      return ir::StructTag::Parameters();
  }
  throw common::InternalError("TypeLowering", "unknown struct kind");
}

auto TypeLowering::Lower(const ast::Type& type) const -> ir::Type {
  using Kind = ast::Type::Kind;
  spdlog::trace("lowering {} type", ast::ToString(type.kind));

  switch (type.kind) {
    case Kind::kBool:
      return ir::Type::Bool();
    case Kind::kInt:
      return ir::Type::Int(std::get<ast::IntData>(type.data).width);
    case Kind::kUint:
      return ir::Type::Uint(std::get<ast::IntData>(type.data).width);
    case Kind::kBytes:
      return ir::Type::Bytes(std::get<ast::IntData>(type.data).width);
    case Kind::kAddress:
    case Kind::kContract:
      return ir::Type::Bytes(params_.address_length);
    case Kind::kValue:
      return ir::Type::Uint(static_cast<uint16_t>(params_.value_length * 8));
    case Kind::kFunctionSelector:
      return ir::Type::Uint(static_cast<uint16_t>(params_.selector_length * 8));
    case Kind::kEnum: {
      uint32_t id = std::get<ast::DeclRef>(type.data).id;
      if (id >= ns_.enums.size()) {
        throw common::InternalError(
            "TypeLowering", fmt::format("enum #{} not declared", id));
      }
      return ir::Type::Uint(ns_.enums[id].bits);
    }
    case Kind::kUserType: {
      uint32_t id = std::get<ast::DeclRef>(type.data).id;
      if (id >= ns_.user_types.size()) {
        throw common::InternalError(
            "TypeLowering", fmt::format("user type #{} not declared", id));
      }
      return Lower(ns_.user_types[id].underlying);
    }
    case Kind::kString:
    case Kind::kDynamicBytes:
      return DynamicBytes();
    case Kind::kArray: {
      const auto& arr = std::get<ast::ArrayData>(type.data);
      return ir::Type::Ptr(
          ir::Type::Array(Lower(*arr.element), LowerDims(arr.dims)));
    }
    case Kind::kStruct:
      return ir::Type::Ptr(
          ir::Type::Struct(LowerStruct(std::get<ast::StructRef>(type.data))));
    case Kind::kSlice:
      return ir::Type::Ptr(ir::Type::Slice(
          Lower(*std::get<ast::ElementData>(type.data).element)));
    case Kind::kBufferPointer:
      return ir::Type::Ptr(ir::Type::Bytes(1));
    case Kind::kMapping: {
      const auto& map = std::get<ast::MappingData>(type.data);
      return ir::Type::Mapping(Lower(*map.key), Lower(*map.value));
    }
    case Kind::kRef:
      return ir::Type::Ptr(
          Lower(*std::get<ast::ElementData>(type.data).element));
    case Kind::kStorageRef: {
      const auto& ref = std::get<ast::StorageRefData>(type.data);
      return ir::Type::StoragePtr(ref.is_immutable, Lower(*ref.element));
    }
    case Kind::kInternalFunction: {
      const auto& fn = std::get<ast::FunctionData>(type.data);
      return ir::Type::Ptr(
          ir::Type::Function(LowerAll(fn.params), LowerAll(fn.returns)));
    }
    case Kind::kExternalFunction:
      return ir::Type::Ptr(
          ir::Type::Struct(ir::StructTag::ExternalFunction()));
    case Kind::kRational:
    case Kind::kVoid:
    case Kind::kUnreachable:
    case Kind::kUnresolved:
      break;
  }
  throw common::InternalError(
      "TypeLowering",
      fmt::format(
          "{} type has no IR representation", ast::ToString(type.kind)));
}

}  // namespace ssair::lowering
