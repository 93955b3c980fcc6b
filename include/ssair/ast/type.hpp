#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ssair::ast {

// Source-level types as produced by semantic analysis. Only the shape type
// lowering needs is modelled here; resolution and checking happen upstream.
struct Type;

struct ArrayDim {
  enum class Kind { kFixed, kDynamic, kAnyFixed };

  Kind kind = Kind::kDynamic;
  uint64_t size = 0;  // kFixed only
};

// Built-in structs the runtime defines, plus user-declared ones by index.
struct StructRef {
  enum class Kind {
    kUserDefined,
    kAccountInfo,
    kAccountMeta,
    kExternalFunction,
    kParameters,
  };

  Kind kind = Kind::kUserDefined;
  uint32_t id = 0;  // kUserDefined only
};

struct IntData {
  uint16_t width = 0;
};

// Index into Namespace::enums, Namespace::user_types or the contract list.
struct DeclRef {
  uint32_t id = 0;
};

struct ElementData {
  std::shared_ptr<const Type> element;
};

struct ArrayData {
  std::shared_ptr<const Type> element;
  std::vector<ArrayDim> dims;
};

struct MappingData {
  std::shared_ptr<const Type> key;
  std::shared_ptr<const Type> value;
};

struct StorageRefData {
  bool is_immutable = false;
  std::shared_ptr<const Type> element;
};

struct FunctionData {
  std::vector<Type> params;
  std::vector<Type> returns;
};

struct Type {
  enum class Kind {
    kAddress,
    kBool,
    kString,
    kDynamicBytes,
    kInt,
    kUint,
    kRational,
    kBytes,
    kEnum,
    kStruct,
    kArray,
    kMapping,
    kContract,
    kRef,
    kStorageRef,
    kInternalFunction,
    kExternalFunction,
    kUserType,
    kValue,
    kVoid,
    kUnreachable,
    kSlice,
    kBufferPointer,
    kFunctionSelector,
    kUnresolved,
  };

  Kind kind = Kind::kUnresolved;
  std::variant<
      std::monostate, IntData, DeclRef, StructRef, ElementData, ArrayData,
      MappingData, StorageRefData, FunctionData>
      data{};

  static auto Simple(Kind kind) -> Type {
    return Type{.kind = kind};
  }

  static auto Int(uint16_t width) -> Type {
    return Type{.kind = Kind::kInt, .data = IntData{.width = width}};
  }

  static auto Uint(uint16_t width) -> Type {
    return Type{.kind = Kind::kUint, .data = IntData{.width = width}};
  }

  static auto Bytes(uint16_t width) -> Type {
    return Type{.kind = Kind::kBytes, .data = IntData{.width = width}};
  }

  static auto Enum(uint32_t id) -> Type {
    return Type{.kind = Kind::kEnum, .data = DeclRef{.id = id}};
  }

  static auto Contract(uint32_t id) -> Type {
    return Type{.kind = Kind::kContract, .data = DeclRef{.id = id}};
  }

  static auto UserType(uint32_t id) -> Type {
    return Type{.kind = Kind::kUserType, .data = DeclRef{.id = id}};
  }

  static auto Struct(StructRef ref) -> Type {
    return Type{.kind = Kind::kStruct, .data = ref};
  }

  static auto Array(Type element, std::vector<ArrayDim> dims) -> Type {
    return Type{
        .kind = Kind::kArray,
        .data = ArrayData{
            .element = std::make_shared<const Type>(std::move(element)),
            .dims = std::move(dims)}};
  }

  static auto Mapping(Type key, Type value) -> Type {
    return Type{
        .kind = Kind::kMapping,
        .data = MappingData{
            .key = std::make_shared<const Type>(std::move(key)),
            .value = std::make_shared<const Type>(std::move(value))}};
  }

  static auto Ref(Type element) -> Type {
    return Type{
        .kind = Kind::kRef,
        .data = ElementData{
            .element = std::make_shared<const Type>(std::move(element))}};
  }

  static auto StorageRef(bool is_immutable, Type element) -> Type {
    return Type{
        .kind = Kind::kStorageRef,
        .data = StorageRefData{
            .is_immutable = is_immutable,
            .element = std::make_shared<const Type>(std::move(element))}};
  }

  static auto Slice(Type element) -> Type {
    return Type{
        .kind = Kind::kSlice,
        .data = ElementData{
            .element = std::make_shared<const Type>(std::move(element))}};
  }

  static auto InternalFunction(
      std::vector<Type> params, std::vector<Type> returns) -> Type {
    return Type{
        .kind = Kind::kInternalFunction,
        .data = FunctionData{
            .params = std::move(params), .returns = std::move(returns)}};
  }

  static auto ExternalFunction(
      std::vector<Type> params, std::vector<Type> returns) -> Type {
    return Type{
        .kind = Kind::kExternalFunction,
        .data = FunctionData{
            .params = std::move(params), .returns = std::move(returns)}};
  }
};

auto ToString(Type::Kind kind) -> const char*;

struct EnumDecl {
  std::string name;
  uint16_t bits = 8;  // width of the declared base type
};

struct UserTypeDecl {
  std::string name;
  Type underlying;
};

// Declarations type lowering consults; indexed by DeclRef::id.
struct Namespace {
  std::vector<EnumDecl> enums;
  std::vector<UserTypeDecl> user_types;
};

}  // namespace ssair::ast
