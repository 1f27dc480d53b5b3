#ifndef SELFCORE_EVAL_NORMALIZER_HPP
#define SELFCORE_EVAL_NORMALIZER_HPP

#include <core/module.hpp>
#include "hoas.hpp"

namespace selfcore::eval {
#include "macros_open.hpp"

  using core::Definitions;

  // Weak-head reduction in closure form. Same rules as `evalTerm`, with beta steps done by calling binders.
  // Lifetime of the resulting node is bounded by `defs` and `bridge`.
  auto reduceTermH(Definitions const& defs, Bridge& bridge, TermH const* t) -> TermH const*;

  // Full normalization in closure form: weak-head reduces, then normalizes all children,
  // including binder bodies (the returned binders normalize whatever they are instantiated to).
  // Lifetime of the resulting node is bounded by `defs` and `bridge`.
  auto normalizeTermH(Definitions const& defs, Bridge& bridge, TermH const* t) -> TermH const*;

  // Converts `term` to closure form, reduces it to weak-head normal form and converts it back.
  // Agrees with `evalTerm` on all inputs.
  // Lifetime of the resulting term is bounded by `pool`.
  auto reduce(Definitions const& defs, Term const* term, Allocator<Term>& pool) -> Term const*;

  // Converts `term` to closure form, normalizes it and converts it back.
  // Does not terminate on non-normalizing inputs.
  // Lifetime of the resulting term is bounded by `pool`.
  auto normalize(Definitions const& defs, Term const* term, Allocator<Term>& pool) -> Term const*;

#include "macros_close.hpp"
}

#endif // SELFCORE_EVAL_NORMALIZER_HPP
