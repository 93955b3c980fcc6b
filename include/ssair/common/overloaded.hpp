#pragma once

namespace ssair {

// Lambda set for visiting ExpressionData and InstructionData. The printer and
// the operand/successor queries list one lambda per IR struct, so a new
// struct without a case there is a compile error.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace ssair
