#include "ssair/ir/type.hpp"

#include <memory>
#include <string>
#include <variant>

#include <fmt/core.h>

#include "ssair/common/internal_error.hpp"

namespace ssair::ir {

namespace {

auto DeepEqual(
    const std::shared_ptr<const Type>& a, const std::shared_ptr<const Type>& b)
    -> bool {
  if (a == nullptr || b == nullptr) {
    return a == b;
  }
  return *a == *b;
}

auto JoinTypes(const std::vector<Type>& types) -> std::string {
  std::string out;
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += types[i].ToString();
  }
  return out;
}

}  // namespace

auto StructTag::Vector(Type element) -> StructTag {
  return StructTag{
      .kind = Kind::kVector,
      .element = std::make_shared<const Type>(std::move(element))};
}

auto StructTag::operator==(const StructTag& other) const -> bool {
  return kind == other.kind && id == other.id &&
         DeepEqual(element, other.element);
}

auto StructTag::ToString() const -> std::string {
  switch (kind) {
    case Kind::kUserDefined:
      return fmt::format("{}", id);
    case Kind::kAccountInfo:
      return "SolAccountInfo";
    case Kind::kAccountMeta:
      return "SolAccountMeta";
    case Kind::kParameters:
      return "SolParameters";
    case Kind::kExternalFunction:
      return "ExternalFunction";
    case Kind::kVector:
      return fmt::format("vector<{}>", element->ToString());
  }
  return "<?>";
}

auto PointerData::operator==(const PointerData& other) const -> bool {
  return is_immutable == other.is_immutable && DeepEqual(pointee, other.pointee);
}

auto FunctionData::operator==(const FunctionData& other) const -> bool {
  return params == other.params && returns == other.returns;
}

auto MappingData::operator==(const MappingData& other) const -> bool {
  return DeepEqual(key, other.key) && DeepEqual(value, other.value);
}

auto ArrayData::operator==(const ArrayData& other) const -> bool {
  return dims == other.dims && DeepEqual(element, other.element);
}

auto Type::Bytes(uint16_t width) -> Type {
  if (width < 1 || width > 32) {
    throw common::InternalError(
        "Type::Bytes", fmt::format("bytes width {} outside 1..32", width));
  }
  return Type{.kind = Kind::kBytes, .data = WidthData{.width = width}};
}

auto Type::Width() const -> uint16_t {
  if (kind != Kind::kInt && kind != Kind::kUint && kind != Kind::kBytes) {
    throw common::InternalError(
        "Type::Width", fmt::format("{} has no width", ToString()));
  }
  return std::get<WidthData>(data).width;
}

auto Type::Pointee() const -> const Type& {
  if (kind != Kind::kPtr && kind != Kind::kStoragePtr && kind != Kind::kSlice) {
    throw common::InternalError(
        "Type::Pointee", fmt::format("{} is not a pointer or slice", ToString()));
  }
  return *std::get<PointerData>(data).pointee;
}

auto Type::IsImmutable() const -> bool {
  if (kind != Kind::kStoragePtr) {
    return false;
  }
  return std::get<PointerData>(data).is_immutable;
}

auto Type::AsFunction() const -> const FunctionData& {
  if (kind != Kind::kFunction) {
    throw common::InternalError(
        "Type::AsFunction", fmt::format("{} is not a function", ToString()));
  }
  return std::get<FunctionData>(data);
}

auto Type::AsMapping() const -> const MappingData& {
  if (kind != Kind::kMapping) {
    throw common::InternalError(
        "Type::AsMapping", fmt::format("{} is not a mapping", ToString()));
  }
  return std::get<MappingData>(data);
}

auto Type::AsArray() const -> const ArrayData& {
  if (kind != Kind::kArray) {
    throw common::InternalError(
        "Type::AsArray", fmt::format("{} is not an array", ToString()));
  }
  return std::get<ArrayData>(data);
}

auto Type::AsStruct() const -> const StructTag& {
  if (kind != Kind::kStruct) {
    throw common::InternalError(
        "Type::AsStruct", fmt::format("{} is not a struct", ToString()));
  }
  return std::get<StructTag>(data);
}

auto Type::ToString() const -> std::string {
  switch (kind) {
    case Kind::kBool:
      return "bool";
    case Kind::kInt:
      return fmt::format("int{}", std::get<WidthData>(data).width);
    case Kind::kUint:
      return fmt::format("uint{}", std::get<WidthData>(data).width);
    case Kind::kBytes:
      return fmt::format("bytes{}", std::get<WidthData>(data).width);
    case Kind::kPtr:
      return fmt::format("ptr<{}>", Pointee().ToString());
    case Kind::kStoragePtr:
      if (IsImmutable()) {
        return fmt::format("const_storage_ptr<{}>", Pointee().ToString());
      }
      return fmt::format("storage_ptr<{}>", Pointee().ToString());
    case Kind::kFunction: {
      const auto& fn = std::get<FunctionData>(data);
      return fmt::format(
          "fn({}) -> ({})", JoinTypes(fn.params), JoinTypes(fn.returns));
    }
    case Kind::kMapping: {
      const auto& map = std::get<MappingData>(data);
      return fmt::format(
          "mapping<{} -> {}>", map.key->ToString(), map.value->ToString());
    }
    case Kind::kArray: {
      const auto& arr = std::get<ArrayData>(data);
      std::string out = arr.element->ToString();
      for (const auto& dim : arr.dims) {
        switch (dim.kind) {
          case ArrayLength::Kind::kFixed:
            out += fmt::format("[{}]", dim.size);
            break;
          case ArrayLength::Kind::kDynamic:
            out += "[]";
            break;
          case ArrayLength::Kind::kAnyFixed:
            out += "[?]";
            break;
        }
      }
      return out;
    }
    case Kind::kStruct:
      return fmt::format("struct.{}", std::get<StructTag>(data).ToString());
    case Kind::kSlice:
      return fmt::format("slice<{}>", Pointee().ToString());
  }
  return "<?>";
}

auto ToString(Type::Kind kind) -> const char* {
  switch (kind) {
    case Type::Kind::kBool:
      return "bool";
    case Type::Kind::kInt:
      return "int";
    case Type::Kind::kUint:
      return "uint";
    case Type::Kind::kBytes:
      return "bytes";
    case Type::Kind::kPtr:
      return "ptr";
    case Type::Kind::kStoragePtr:
      return "storage_ptr";
    case Type::Kind::kFunction:
      return "function";
    case Type::Kind::kMapping:
      return "mapping";
    case Type::Kind::kArray:
      return "array";
    case Type::Kind::kStruct:
      return "struct";
    case Type::Kind::kSlice:
      return "slice";
  }
  return "unknown";
}

}  // namespace ssair::ir
