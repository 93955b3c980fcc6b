#include "ssair/ast/type.hpp"

namespace ssair::ast {

auto ToString(Type::Kind kind) -> const char* {
  switch (kind) {
    case Type::Kind::kAddress:
      return "address";
    case Type::Kind::kBool:
      return "bool";
    case Type::Kind::kString:
      return "string";
    case Type::Kind::kDynamicBytes:
      return "bytes";
    case Type::Kind::kInt:
      return "int";
    case Type::Kind::kUint:
      return "uint";
    case Type::Kind::kRational:
      return "rational";
    case Type::Kind::kBytes:
      return "bytesN";
    case Type::Kind::kEnum:
      return "enum";
    case Type::Kind::kStruct:
      return "struct";
    case Type::Kind::kArray:
      return "array";
    case Type::Kind::kMapping:
      return "mapping";
    case Type::Kind::kContract:
      return "contract";
    case Type::Kind::kRef:
      return "ref";
    case Type::Kind::kStorageRef:
      return "storage ref";
    case Type::Kind::kInternalFunction:
      return "internal function";
    case Type::Kind::kExternalFunction:
      return "external function";
    case Type::Kind::kUserType:
      return "user type";
    case Type::Kind::kValue:
      return "value";
    case Type::Kind::kVoid:
      return "void";
    case Type::Kind::kUnreachable:
      return "unreachable";
    case Type::Kind::kSlice:
      return "slice";
    case Type::Kind::kBufferPointer:
      return "buffer pointer";
    case Type::Kind::kFunctionSelector:
      return "function selector";
    case Type::Kind::kUnresolved:
      return "unresolved";
  }
  return "unknown";
}

}  // namespace ssair::ast
