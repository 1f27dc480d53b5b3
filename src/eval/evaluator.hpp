#ifndef SELFCORE_EVAL_EVALUATOR_HPP
#define SELFCORE_EVAL_EVALUATOR_HPP

#include <optional>
#include <string>
#include <core/module.hpp>
#include <core/term.hpp>

namespace selfcore::eval {
#include "macros_open.hpp"

  using core::Term;
  using core::Definitions;

  // Returns the stored term for `name`, or `std::nullopt` if `name` is undefined
  // or is defined as a reference to itself (the only cycle detected here).
  auto unfold(std::string const& name, Definitions const& defs) -> std::optional<Term const*>;

  // Returns the stored term for `name`, or `Ref(name)` if it cannot be unfolded.
  // Lifetime of the resulting term is bounded by `defs` and `pool`.
  auto deref(std::string const& name, Definitions const& defs, Allocator<Term>& pool) -> Term const*;

  // Call-by-name weak-head reduction on de Bruijn terms.
  // Arguments consumed by a beta step are passed unreduced; arguments of stuck applications are reduced.
  // Does not reduce under binders. Does not terminate on non-normalizing inputs.
  // Lifetime of the resulting term is bounded by `term`, `defs` and `pool`.
  auto evalTerm(Term const* term, Definitions const& defs, Allocator<Term>& pool) -> Term const*;

#include "macros_close.hpp"
}

#endif // SELFCORE_EVAL_EVALUATOR_HPP
