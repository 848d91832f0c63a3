#pragma once

namespace polyglot {

// Visitor for std::visit over closed variants such as matcher::PatternKind.
//
//   std::visit(Overloaded{
//       [](const Literal& l) { ... },
//       [](const Wildcard&) { ... },
//   }, pattern.kind);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace polyglot
