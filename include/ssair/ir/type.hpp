#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace ssair::ir {

struct Type;

// One array dimension. kAnyFixed is a fixed but unspecified length, used in
// generic contexts.
struct ArrayLength {
  enum class Kind { kFixed, kDynamic, kAnyFixed };

  Kind kind = Kind::kDynamic;
  uint64_t size = 0;  // kFixed only

  static auto Fixed(uint64_t size) -> ArrayLength {
    return ArrayLength{.kind = Kind::kFixed, .size = size};
  }

  static auto Dynamic() -> ArrayLength {
    return ArrayLength{.kind = Kind::kDynamic};
  }

  static auto AnyFixed() -> ArrayLength {
    return ArrayLength{.kind = Kind::kAnyFixed};
  }

  auto operator==(const ArrayLength&) const -> bool = default;
};

// Reference to a structure layout. kVector is the lowered shape of source
// strings and dynamic byte arrays: a length-prefixed buffer of `element`.
struct StructTag {
  enum class Kind {
    kUserDefined,
    kAccountInfo,
    kAccountMeta,
    kParameters,
    kExternalFunction,
    kVector,
  };

  Kind kind = Kind::kUserDefined;
  uint32_t id = 0;                      // kUserDefined only
  std::shared_ptr<const Type> element;  // kVector only

  static auto UserDefined(uint32_t id) -> StructTag {
    return StructTag{.kind = Kind::kUserDefined, .id = id};
  }

  static auto AccountInfo() -> StructTag {
    return StructTag{.kind = Kind::kAccountInfo};
  }

  static auto AccountMeta() -> StructTag {
    return StructTag{.kind = Kind::kAccountMeta};
  }

  static auto Parameters() -> StructTag {
    return StructTag{.kind = Kind::kParameters};
  }

  static auto ExternalFunction() -> StructTag {
    return StructTag{.kind = Kind::kExternalFunction};
  }

  static auto Vector(Type element) -> StructTag;

  auto operator==(const StructTag& other) const -> bool;

  [[nodiscard]] auto ToString() const -> std::string;
};

struct WidthData {
  uint16_t width = 0;

  auto operator==(const WidthData&) const -> bool = default;
};

// Ptr, StoragePtr and Slice. is_immutable is only meaningful for StoragePtr.
struct PointerData {
  std::shared_ptr<const Type> pointee;
  bool is_immutable = false;

  auto operator==(const PointerData& other) const -> bool;
};

struct FunctionData {
  std::vector<Type> params;
  std::vector<Type> returns;

  auto operator==(const FunctionData& other) const -> bool;
};

struct MappingData {
  std::shared_ptr<const Type> key;
  std::shared_ptr<const Type> value;

  auto operator==(const MappingData& other) const -> bool;
};

// Dimensions are listed outer-to-inner.
struct ArrayData {
  std::shared_ptr<const Type> element;
  std::vector<ArrayLength> dims;

  auto operator==(const ArrayData& other) const -> bool;
};

struct Type {
  enum class Kind {
    kBool,
    kInt,
    kUint,
    kBytes,
    kPtr,
    kStoragePtr,
    kFunction,
    kMapping,
    kArray,
    kStruct,
    kSlice,
  };

  Kind kind = Kind::kBool;
  std::variant<
      std::monostate, WidthData, PointerData, FunctionData, MappingData,
      ArrayData, StructTag>
      data{};

  static auto Bool() -> Type {
    return Type{.kind = Kind::kBool};
  }

  static auto Int(uint16_t width) -> Type {
    return Type{.kind = Kind::kInt, .data = WidthData{.width = width}};
  }

  static auto Uint(uint16_t width) -> Type {
    return Type{.kind = Kind::kUint, .data = WidthData{.width = width}};
  }

  // Width in bytes, 1..32. Anything else is an internal compiler error.
  static auto Bytes(uint16_t width) -> Type;

  static auto Ptr(Type pointee) -> Type {
    return Type{
        .kind = Kind::kPtr,
        .data = PointerData{
            .pointee = std::make_shared<const Type>(std::move(pointee))}};
  }

  static auto StoragePtr(bool is_immutable, Type pointee) -> Type {
    return Type{
        .kind = Kind::kStoragePtr,
        .data = PointerData{
            .pointee = std::make_shared<const Type>(std::move(pointee)),
            .is_immutable = is_immutable}};
  }

  static auto Function(std::vector<Type> params, std::vector<Type> returns)
      -> Type {
    return Type{
        .kind = Kind::kFunction,
        .data = FunctionData{
            .params = std::move(params), .returns = std::move(returns)}};
  }

  static auto Mapping(Type key, Type value) -> Type {
    return Type{
        .kind = Kind::kMapping,
        .data = MappingData{
            .key = std::make_shared<const Type>(std::move(key)),
            .value = std::make_shared<const Type>(std::move(value))}};
  }

  static auto Array(Type element, std::vector<ArrayLength> dims) -> Type {
    return Type{
        .kind = Kind::kArray,
        .data = ArrayData{
            .element = std::make_shared<const Type>(std::move(element)),
            .dims = std::move(dims)}};
  }

  static auto Struct(StructTag tag) -> Type {
    return Type{.kind = Kind::kStruct, .data = std::move(tag)};
  }

  static auto Slice(Type element) -> Type {
    return Type{
        .kind = Kind::kSlice,
        .data = PointerData{
            .pointee = std::make_shared<const Type>(std::move(element))}};
  }

  // Bit width for Int/Uint, byte width for Bytes.
  [[nodiscard]] auto Width() const -> uint16_t;

  // Target of Ptr/StoragePtr, element of Slice.
  [[nodiscard]] auto Pointee() const -> const Type&;

  [[nodiscard]] auto IsImmutable() const -> bool;

  [[nodiscard]] auto IsPointer() const -> bool {
    return kind == Kind::kPtr || kind == Kind::kStoragePtr;
  }

  [[nodiscard]] auto IsInteger() const -> bool {
    return kind == Kind::kInt || kind == Kind::kUint;
  }

  [[nodiscard]] auto AsFunction() const -> const FunctionData&;
  [[nodiscard]] auto AsMapping() const -> const MappingData&;
  [[nodiscard]] auto AsArray() const -> const ArrayData&;
  [[nodiscard]] auto AsStruct() const -> const StructTag&;

  auto operator==(const Type& other) const -> bool {
    return kind == other.kind && data == other.data;
  }

  [[nodiscard]] auto ToString() const -> std::string;
};

auto ToString(Type::Kind kind) -> const char*;

inline auto operator<<(std::ostream& os, const Type& type) -> std::ostream& {
  return os << type.ToString();
}

}  // namespace ssair::ir

template <>
struct fmt::formatter<ssair::ir::Type> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const ssair::ir::Type& type, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", type.ToString());
  }
};
