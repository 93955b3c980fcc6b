#include "ssair/ir/printer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "ssair/common/internal_error.hpp"
#include "ssair/common/overloaded.hpp"
#include "ssair/ir/operator.hpp"

namespace ssair::ir {

namespace {

auto FormatBlock(BlockId id) -> std::string {
  return fmt::format("block#{}", id.value);
}

auto JoinBytes(const std::vector<uint8_t>& bytes, const char* sep)
    -> std::string {
  std::string out;
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += fmt::format("{:02x}", bytes[i]);
  }
  return out;
}

// Puts the indent level back when a dump unwinds part way through.
class IndentRestore {
 public:
  explicit IndentRestore(int& indent) : indent_(indent), saved_(indent) {
  }
  ~IndentRestore() {
    indent_ = saved_;
  }

  IndentRestore(const IndentRestore&) = delete;
  auto operator=(const IndentRestore&) -> IndentRestore& = delete;

 private:
  int& indent_;
  int saved_;
};

}  // namespace

Printer::Printer(const VarTable* vars, std::ostream* out)
    : vars_(vars), out_(out) {
}

void Printer::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Printer::Indent() {
  ++indent_;
}

void Printer::Dedent() {
  if (indent_ == 0) {
    throw common::InternalError("Printer::Dedent", "indent underflow");
  }
  --indent_;
}

auto Printer::FormatType(const Type& type) const -> std::string {
  return type.ToString();
}

auto Printer::FormatVar(VarId id) const -> std::string {
  if (!vars_->Contains(id)) {
    throw common::InternalError(
        "Printer",
        fmt::format("reference to undeclared variable %{}", id.value));
  }
  return fmt::format("%{}", id.value);
}

auto Printer::FormatOperand(const Operand& op) const -> std::string {
  if (op.IsId()) {
    return FormatVar(op.AsVar());
  }
  return op.ToString();
}

auto Printer::FormatOptional(
    const char* label, const std::optional<Operand>& op) const -> std::string {
  if (!op) {
    return "_";
  }
  return fmt::format("{}:{}", label, FormatOperand(*op));
}

auto Printer::FormatOperandList(const std::vector<Operand>& ops) const
    -> std::string {
  std::string out;
  for (size_t i = 0; i < ops.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += FormatOperand(ops[i]);
  }
  return out;
}

// Compile-time sides print as the quoted decimal byte list, e.g. "[97, 98]".
auto Printer::FormatStringLocation(const StringLocation& loc) const
    -> std::string {
  if (const auto* op = std::get_if<Operand>(&loc.payload)) {
    return FormatOperand(*op);
  }
  const auto& bytes = std::get<std::vector<uint8_t>>(loc.payload);
  std::string out = "\"[";
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += fmt::format("{}", bytes[i]);
  }
  out += "]\"";
  return out;
}

auto Printer::FormatExpression(const Expression& expr) const -> std::string {
  return std::visit(
      Overloaded{
          [this](const BinaryExpr& e) {
            return fmt::format(
                "{} {} {}", FormatOperand(e.left), ToString(e.op),
                FormatOperand(e.right));
          },
          [this](const UnaryExpr& e) {
            return fmt::format("{}{}", ToString(e.op), FormatOperand(e.operand));
          },
          [](const NumberLiteralExpr& e) {
            return fmt::format("{}({})", e.type.ToString(), e.value.ToString());
          },
          [](const BoolLiteralExpr& e) {
            return std::string(e.value ? "true" : "false");
          },
          [](const BytesLiteralExpr& e) {
            return fmt::format(
                "{} hex\"{}\"", e.type.ToString(), JoinBytes(e.value, "_"));
          },
          [this](const ArrayLiteralExpr& e) {
            return fmt::format(
                "{} [{}]", e.type.ToString(), FormatOperandList(e.values));
          },
          [this](const ConstArrayLiteralExpr& e) {
            return fmt::format(
                "const {} [{}]", e.type.ToString(),
                FormatOperandList(e.values));
          },
          [this](const StructLiteralExpr& e) {
            return fmt::format("struct {{ {} }}", FormatOperandList(e.values));
          },
          [this](const IdExpr& e) { return FormatVar(e.id); },
          [this](const GetRefExpr& e) {
            return fmt::format("&{}", FormatOperand(e.operand));
          },
          [this](const LoadExpr& e) {
            return fmt::format("*{}", FormatOperand(e.operand));
          },
          [this](const StructMemberExpr& e) {
            return fmt::format("{}->{}", FormatOperand(e.operand), e.member);
          },
          [this](const SubscriptExpr& e) {
            return fmt::format(
                "{}[{}]", FormatOperand(e.array), FormatOperand(e.index));
          },
          [this](const AdvancePointerExpr& e) {
            return fmt::format(
                "ptr_add({}, {})", FormatOperand(e.pointer),
                FormatOperand(e.bytes_offset));
          },
          [this](const CastExpr& e) {
            return fmt::format(
                "(cast {} as {})", FormatOperand(e.operand), e.to.ToString());
          },
          [this](const BytesCastExpr& e) {
            return fmt::format(
                "(bytes_cast {} as {})", FormatOperand(e.operand),
                e.to.ToString());
          },
          [this](const SignExtExpr& e) {
            return fmt::format(
                "(sext {} to {})", FormatOperand(e.operand), e.to.ToString());
          },
          [this](const ZeroExtExpr& e) {
            return fmt::format(
                "(zext {} to {})", FormatOperand(e.operand), e.to.ToString());
          },
          [this](const TruncExpr& e) {
            return fmt::format(
                "(trunc {} to {})", FormatOperand(e.operand), e.to.ToString());
          },
          [this](const AllocDynamicBytesExpr& e) {
            if (e.type.kind != Type::Kind::kPtr) {
              throw common::InternalError(
                  "Printer",
                  fmt::format(
                      "cannot print allocation of non-pointer type {}",
                      e.type.ToString()));
            }
            std::string out = fmt::format(
                "alloc {}[{}]", e.type.Pointee().ToString(),
                FormatOperand(e.size));
            if (e.initializer) {
              out += fmt::format(" {{{}}}", JoinBytes(*e.initializer, ", "));
            }
            return out;
          },
          [this](const Keccak256Expr& e) {
            return fmt::format("keccak256({})", FormatOperandList(e.args));
          },
          [this](const StringCompareExpr& e) {
            return fmt::format(
                "strcmp({}, {})", FormatStringLocation(e.left),
                FormatStringLocation(e.right));
          },
          [this](const StringConcatExpr& e) {
            return fmt::format(
                "strcat({}, {})", FormatStringLocation(e.left),
                FormatStringLocation(e.right));
          },
          [this](const StorageArrayLengthExpr& e) {
            return fmt::format("storage_arr_len({})", FormatOperand(e.array));
          },
          [this](const FormatStringExpr& e) {
            std::string out = "fmt_str(";
            for (size_t i = 0; i < e.args.size(); ++i) {
              if (i > 0) {
                out += ", ";
              }
              const auto& [spec, arg] = e.args[i];
              if (spec != FormatArg::kDefault) {
                out += fmt::format("{} ", ToString(spec));
              }
              out += FormatOperand(arg);
            }
            out += ")";
            return out;
          },
          [](const FunctionArgExpr& e) {
            return fmt::format("arg#{}", e.index);
          },
          [](const InternalFunctionCfgExpr& e) {
            return fmt::format("function#{}", e.function.value);
          },
          [](const ReturnDataExpr&) {
            return std::string("(extern_call_ret_data)");
          },
      },
      expr.data);
}

auto Printer::FormatInstruction(const Instruction& insn) const -> std::string {
  return std::visit(
      Overloaded{
          [](const Nop&) { return std::string("nop;"); },
          [this](const Set& i) {
            return fmt::format(
                "{} = {};", FormatVar(i.result), FormatExpression(i.expr));
          },
          [this](const Store& i) {
            return fmt::format(
                "store {} to {};", FormatOperand(i.data),
                FormatOperand(i.dest));
          },
          [this](const LoadStorage& i) {
            return fmt::format(
                "{} = load_storage {};", FormatVar(i.result),
                FormatOperand(i.storage));
          },
          [this](const ClearStorage& i) {
            return fmt::format("clear_storage {};", FormatOperand(i.storage));
          },
          [this](const SetStorage& i) {
            return fmt::format(
                "set_storage {} {};", FormatOperand(i.storage),
                FormatOperand(i.value));
          },
          [this](const SetStorageBytes& i) {
            return fmt::format(
                "set_storage_bytes {} offset:{} value:{};",
                FormatOperand(i.storage), FormatOperand(i.offset),
                FormatOperand(i.value));
          },
          [this](const PushStorage& i) {
            return fmt::format(
                "{} = push_storage {} {};", FormatVar(i.result),
                FormatOperand(i.storage),
                i.value ? FormatOperand(*i.value) : "_");
          },
          [this](const PopStorage& i) {
            std::string out;
            if (i.result) {
              out = fmt::format("{} = ", FormatVar(*i.result));
            }
            out += fmt::format("pop_storage {};", FormatOperand(i.storage));
            return out;
          },
          [this](const PushMemory& i) {
            return fmt::format(
                "{} = push_mem {} {};", FormatVar(i.result), FormatVar(i.array),
                FormatOperand(i.value));
          },
          [this](const PopMemory& i) {
            return fmt::format(
                "{} = pop_mem {};", FormatVar(i.result), FormatVar(i.array));
          },
          [this](const MemCopy& i) {
            return fmt::format(
                "memcopy {} to {} for {} bytes;", FormatOperand(i.source),
                FormatOperand(i.destination), FormatOperand(i.bytes));
          },
          [this](const WriteBuffer& i) {
            return fmt::format(
                "write_buf {} offset:{} value:{};", FormatOperand(i.buf),
                FormatOperand(i.offset), FormatOperand(i.value));
          },
          [this](const ir::Print& i) {
            return fmt::format("print {};", FormatOperand(i.operand));
          },
          [this](const EmitEvent& i) {
            return fmt::format(
                "emit event#{} to topics[{}], data: {};", i.event_id,
                FormatOperandList(i.topics), FormatOperand(i.data));
          },
          [this](const Call& i) {
            std::string out;
            for (size_t idx = 0; idx < i.results.size(); ++idx) {
              out += idx > 0 ? ", " : "";
              out += FormatVar(i.results[idx]);
            }
            if (!i.results.empty()) {
              out += " = ";
            }
            std::string callee = std::visit(
                Overloaded{
                    [](FunctionId f) {
                      return fmt::format("function#{}", f.value);
                    },
                    [this](const Operand& op) { return FormatOperand(op); },
                    [](BuiltinId b) {
                      return fmt::format("builtin#{}", b.value);
                    },
                },
                i.call.callee);
            out += fmt::format(
                "call {}({});", callee, FormatOperandList(i.args));
            return out;
          },
          [this](const ExternalCall& i) {
            std::string out;
            if (i.success) {
              out = fmt::format("{} = ", FormatVar(*i.success));
            }
            std::string contract_function = "_";
            if (i.contract_function) {
              contract_function = fmt::format(
                  "contract_function:({}, {})",
                  i.contract_function->contract_id,
                  i.contract_function->function_id);
            }
            out += fmt::format(
                "call_ext [{}] {} payload:{} value:{} gas:{} {} {} {} {};",
                ToString(i.callty), FormatOptional("address", i.address),
                FormatOperand(i.payload), FormatOperand(i.value),
                FormatOperand(i.gas), FormatOptional("accounts", i.accounts),
                FormatOptional("seeds", i.seeds), contract_function,
                FormatOptional("flags", i.flags));
            return out;
          },
          [this](const Constructor& i) {
            std::string out = FormatVar(i.result);
            if (i.success) {
              out += fmt::format(", {}", FormatVar(*i.success));
            }
            std::string no =
                i.constructor_no ? fmt::format("{}", *i.constructor_no) : "_";
            out += fmt::format(
                " = constructor(no: {}, contract_no:{}) {} {} gas:{} {} {} "
                "encoded-buffer:{} {};",
                no, i.contract_no, FormatOptional("salt", i.salt),
                FormatOptional("value", i.value), FormatOperand(i.gas),
                FormatOptional("address", i.address),
                FormatOptional("seeds", i.seeds),
                FormatOperand(i.encoded_args),
                FormatOptional("accounts", i.accounts));
            return out;
          },
          [this](const ValueTransfer& i) {
            std::string out;
            if (i.success) {
              out = fmt::format("{} = ", FormatVar(*i.success));
            }
            out += fmt::format(
                "transfer {} to {};", FormatOperand(i.value),
                FormatOperand(i.address));
            return out;
          },
          [this](const SelfDestruct& i) {
            return fmt::format("self_destruct {};", FormatOperand(i.recipient));
          },
          [](const Branch& i) {
            return fmt::format("br {};", FormatBlock(i.block));
          },
          [this](const BranchCond& i) {
            return fmt::format(
                "cbr {} {} else {};", FormatOperand(i.cond),
                FormatBlock(i.true_block), FormatBlock(i.false_block));
          },
          [this](const Switch& i) {
            std::string cases;
            for (size_t idx = 0; idx < i.cases.size(); ++idx) {
              if (idx > 0) {
                cases += ", ";
              }
              cases += fmt::format(
                  "{} => {}", FormatOperand(i.cases[idx].first),
                  FormatBlock(i.cases[idx].second));
            }
            return fmt::format(
                "switch {} cases: [{}] default: {};", FormatOperand(i.cond),
                cases, FormatBlock(i.default_block));
          },
          [this](const Return& i) {
            if (i.values.empty()) {
              return std::string("return;");
            }
            return fmt::format("return {};", FormatOperandList(i.values));
          },
          [this](const ReturnData& i) {
            return fmt::format(
                "return_data {} of length {};", FormatOperand(i.data),
                FormatOperand(i.data_len));
          },
          [](const ReturnCode& i) {
            return fmt::format("return_code \"{}\";", ToString(i.code));
          },
          [this](const AssertFailure& i) {
            if (!i.encoded_args) {
              return std::string("assert_failure;");
            }
            return fmt::format(
                "assert_failure {};", FormatOperand(*i.encoded_args));
          },
          [](const Unimplemented& i) {
            return std::string(
                i.reachable ? "unimplemented: reachable;"
                            : "unimplemented: unreachable;");
          },
          [this](const Phi& i) {
            std::string inputs;
            for (size_t idx = 0; idx < i.inputs.size(); ++idx) {
              if (idx > 0) {
                inputs += ", ";
              }
              inputs += fmt::format(
                  "[{}, {}]", FormatOperand(i.inputs[idx].operand),
                  FormatBlock(i.inputs[idx].block));
            }
            return fmt::format("{} = phi {};", FormatVar(i.result), inputs);
          },
      },
      insn.data);
}

void Printer::Print(const Function& func) {
  if (&func.vars != vars_) {
    throw common::InternalError(
        "Printer::Print",
        fmt::format(
            "function#{} printed with a foreign variable table",
            func.id.value));
  }

  std::vector<std::string> params;
  std::vector<std::string> returns;
  for (const auto& t : func.params) {
    params.push_back(FormatType(t));
  }
  for (const auto& t : func.returns) {
    returns.push_back(FormatType(t));
  }
  auto join = [](const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
      out += i > 0 ? ", " : "";
      out += parts[i];
    }
    return out;
  };

  IndentRestore restore(indent_);
  PrintIndent();
  *out_ << fmt::format(
      "function#{} {} ({}) -> ({}):\n", func.id.value, func.name, join(params),
      join(returns));
  Indent();

  PrintIndent();
  *out_ << "vars:\n";
  Indent();
  uint32_t id = 0;
  for (const auto& entry : *vars_) {
    PrintIndent();
    *out_ << fmt::format("%{}: {}", id, FormatType(entry.type));
    if (entry.name) {
      *out_ << " " << *entry.name;
    }
    *out_ << "\n";
    ++id;
  }
  Dedent();

  for (uint32_t i = 0; i < func.blocks.size(); ++i) {
    PrintBlock(func.blocks[i], BlockId{i});
  }

  Dedent();
}

void Printer::PrintBlock(const BasicBlock& bb, BlockId id) {
  IndentRestore restore(indent_);
  PrintIndent();
  *out_ << fmt::format("{}: {}\n", FormatBlock(id), bb.name);
  Indent();
  for (const auto& insn : bb.instructions) {
    PrintIndent();
    *out_ << FormatInstruction(insn) << "\n";
  }
  Dedent();
}

void PrintFunction(const Function& func, std::ostream& out) {
  Printer printer(&func.vars, &out);
  printer.Print(func);
}

}  // namespace ssair::ir
