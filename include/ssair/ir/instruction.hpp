#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "ssair/ir/expression.hpp"
#include "ssair/ir/handle.hpp"
#include "ssair/ir/operand.hpp"

namespace ssair::ir {

// Kind of an external (cross-contract) call.
enum class CallTy { kRegular, kDelegate, kStatic };

auto ToString(CallTy callty) -> const char*;

// Status a function can hand back to the runtime without return data.
enum class ReturnCodeKind {
  kSuccess,
  kFunctionSelectorInvalid,
  kAbiEncodingInvalid,
  kInvalidDataError,
  kAccountDataTooSmall,
  kInvalidProgramId,
};

auto ToString(ReturnCodeKind code) -> const char*;

// Callee of an internal call.
struct InternalCallTy {
  enum class Kind {
    kStatic,   // function known at compile time
    kDynamic,  // function pointer held in an operand
    kBuiltin,  // compiler intrinsic
  };

  Kind kind = Kind::kStatic;
  std::variant<FunctionId, Operand, BuiltinId> callee;

  static auto Static(FunctionId function) -> InternalCallTy {
    return {.kind = Kind::kStatic, .callee = function};
  }

  static auto Dynamic(Operand function) -> InternalCallTy {
    return {.kind = Kind::kDynamic, .callee = std::move(function)};
  }

  static auto Builtin(BuiltinId builtin) -> InternalCallTy {
    return {.kind = Kind::kBuiltin, .callee = builtin};
  }
};

// One incoming edge of a phi.
struct PhiInput {
  Operand operand;
  BlockId block;
};

// ---------------------------------------------------------------------------
// Non-terminators
// ---------------------------------------------------------------------------

struct Nop {};

// result = expr. The only instruction that binds an expression.
struct Set {
  VarId result;
  Expression expr;
};

// *dest = data, for memory pointers.
struct Store {
  Operand dest;
  Operand data;
};

struct LoadStorage {
  VarId result;
  Operand storage;
};

struct ClearStorage {
  Operand storage;
};

struct SetStorage {
  Operand value;
  Operand storage;
};

// Writes a single byte into a storage bytes array.
struct SetStorageBytes {
  Operand value;
  Operand storage;
  Operand offset;
};

// Appends to a storage array. Without a value the element is
// default-initialized. result is the new element's storage slot.
struct PushStorage {
  VarId result;
  std::optional<Operand> value;
  Operand storage;
};

struct PopStorage {
  std::optional<VarId> result;
  Operand storage;
};

// Appends to a memory array; `array` is rebound in place.
struct PushMemory {
  VarId result;
  VarId array;
  Operand value;
};

struct PopMemory {
  VarId result;
  VarId array;
};

struct MemCopy {
  Operand source;
  Operand destination;
  Operand bytes;
};

struct WriteBuffer {
  Operand buf;
  Operand offset;
  Operand value;
};

// Debug print.
struct Print {
  Operand operand;
};

struct EmitEvent {
  uint32_t event_id = 0;
  std::vector<Operand> topics;
  Operand data;
};

struct Call {
  std::vector<VarId> results;
  InternalCallTy call;
  std::vector<Operand> args;
};

// Statically known callee of an external call: (contract id, function id).
struct ContractFunction {
  uint32_t contract_id = 0;
  uint32_t function_id = 0;
};

struct ExternalCall {
  std::optional<VarId> success;
  std::optional<Operand> address;
  std::optional<Operand> accounts;
  std::optional<Operand> seeds;
  Operand payload;
  Operand value;
  Operand gas;
  CallTy callty = CallTy::kRegular;
  std::optional<ContractFunction> contract_function;
  std::optional<Operand> flags;
};

// Deploys a contract; result is the new contract's address.
struct Constructor {
  std::optional<VarId> success;
  VarId result;
  uint32_t contract_no = 0;
  std::optional<uint32_t> constructor_no;
  Operand encoded_args;
  std::optional<Operand> value;
  Operand gas;
  std::optional<Operand> salt;
  std::optional<Operand> address;
  std::optional<Operand> seeds;
  std::optional<Operand> accounts;
};

struct ValueTransfer {
  std::optional<VarId> success;
  Operand address;
  Operand value;
};

struct SelfDestruct {
  Operand recipient;
};

// ---------------------------------------------------------------------------
// Terminators
// ---------------------------------------------------------------------------

struct Branch {
  BlockId block;
};

struct BranchCond {
  Operand cond;
  BlockId true_block;
  BlockId false_block;
};

struct Switch {
  Operand cond;
  std::vector<std::pair<Operand, BlockId>> cases;
  BlockId default_block;
};

struct Return {
  std::vector<Operand> values;
};

struct ReturnData {
  Operand data;
  Operand data_len;
};

struct ReturnCode {
  ReturnCodeKind code = ReturnCodeKind::kSuccess;
};

struct AssertFailure {
  std::optional<Operand> encoded_args;
};

struct Unimplemented {
  bool reachable = false;
};

// ---------------------------------------------------------------------------
// Pseudo-instruction, only at the head of a block
// ---------------------------------------------------------------------------

struct Phi {
  VarId result;
  std::vector<PhiInput> inputs;
};

using InstructionData = std::variant<
    Nop, Set, Store, LoadStorage, ClearStorage, SetStorage, SetStorageBytes,
    PushStorage, PopStorage, PushMemory, PopMemory, MemCopy, WriteBuffer,
    Print, EmitEvent, Call, ExternalCall, Constructor, ValueTransfer,
    SelfDestruct, Branch, BranchCond, Switch, Return, ReturnData, ReturnCode,
    AssertFailure, Unimplemented, Phi>;

struct Instruction {
  InstructionData data;
};

// Branch, BranchCond, Switch, Return, ReturnData, ReturnCode, AssertFailure
// and Unimplemented end a block.
[[nodiscard]] auto IsTerminator(const Instruction& insn) -> bool;

[[nodiscard]] auto IsPhi(const Instruction& insn) -> bool;

// Variables the instruction binds, in print order. PushMemory also rebinds
// its array, which is a use, not a definition.
[[nodiscard]] auto DefinedVars(const Instruction& insn) -> std::vector<VarId>;

// Every operand the instruction reads, including those inside its
// expression and phi inputs.
[[nodiscard]] auto UsedOperands(const Instruction& insn)
    -> std::vector<const Operand*>;

// Variables named directly by id rather than through an Operand
// (IdExpr, PushMemory/PopMemory arrays).
[[nodiscard]] auto UsedVarIds(const Instruction& insn) -> std::vector<VarId>;

// Blocks control may transfer to. Empty for non-terminators and for
// terminators that leave the function.
[[nodiscard]] auto Successors(const Instruction& insn) -> std::vector<BlockId>;

}  // namespace ssair::ir
