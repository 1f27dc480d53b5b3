#ifndef SELFCORE_CORE_TERM_HPP
#define SELFCORE_CORE_TERM_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <common.hpp>

namespace selfcore::core {
#include "macros_open.hpp"

  // Term node, and related syntactic operations.
  // Immutable.
  // Pre (for all methods): there is no "cycle" throughout the tree / DAG
  // Pre & invariant (for all methods): all pointers (in the "active variant") are valid
  // Bound variables are de Bruijn indices. An `All` node binds its self name over the domain,
  // and binds both the self name and the parameter over the codomain (parameter = index 0, self = index 1).
  class Term {
  public:
    // clang-format off
    enum class Tag: uint32_t { Var, Ref, Typ, All, Lam, App, Ann }; using enum Tag;
    enum class VarTag: uint32_t { VVar }; using enum VarTag;
    enum class RefTag: uint32_t { RRef }; using enum RefTag;
    enum class TypTag: uint32_t { TTyp }; using enum TypTag;
    enum class AllTag: uint32_t { AAll }; using enum AllTag;
    enum class LamTag: uint32_t { LLam }; using enum LamTag;
    enum class AppTag: uint32_t { AApp }; using enum AppTag;
    enum class AnnTag: uint32_t { AAnn }; using enum AnnTag;

    Tag const tag;
    union {
      struct { uint64_t const id; } var;
      struct { std::string const s; } ref;
      struct { bool const e; std::string const self, s; Term const *t, *r; } all; // t: domain, r: codomain
      struct { bool const e; std::string const s; Term const* r; } lam;
      struct { bool const e; Term const *l, *r; } app;
      struct { bool const c; Term const *t, *x; } ann;                            // t: type, x: term
    };
    // clang-format on

    // Name of the opaque reference that replaces erased parameters.
    static constexpr std::string_view erasedName = "<erased>";

    // The constructors below guarantee that all pointers in the "active variant" are valid, if parameters are valid
    Term(VarTag, uint64_t id):
        tag(Var),
        var{id} {}

    Term(RefTag, std::string s):
        tag(Ref),
        ref{std::move(s)} {}

    Term(TypTag):
        tag(Typ) {}

    Term(AllTag, bool e, std::string self, std::string s, Term const* t, Term const* r):
        tag(All),
        all{e, std::move(self), std::move(s), t, r} {}

    Term(LamTag, bool e, std::string s, Term const* r):
        tag(Lam),
        lam{e, std::move(s), r} {}

    Term(AppTag, bool e, Term const* l, Term const* r):
        tag(App),
        app{e, l, r} {}

    Term(AnnTag, bool c, Term const* t, Term const* x):
        tag(Ann),
        ann{c, t, x} {}

    // Immutability + non-trivial members in union = impossible to make a copy constructor...
    Term(Term const&) = delete;
    Term(Term&&) = delete;
    auto operator=(Term const&) -> Term& = delete;
    auto operator=(Term&&) -> Term& = delete;

    // Destructor needed for the `std::string`s in union
    ~Term() {
      switch (tag) {
        case Var:
          return;
        case Ref:
          ref.s.~basic_string();
          return;
        case Typ:
          return;
        case All:
          all.self.~basic_string();
          all.s.~basic_string();
          return;
        case Lam:
          lam.s.~basic_string();
          return;
        case App:
          return;
        case Ann:
          return;
      }
      unreachable;
    }

    // Deep copy whole term to `pool`
    // O(size)
    auto clone(Allocator<Term>& pool) const -> Term const*;

    // Syntactical equality and hash code (up to alpha-renaming!)
    // Erasure and annotation flags are significant.
    // O(size)
    auto operator==(Term const& rhs) const noexcept -> bool;
    auto operator!=(Term const& rhs) const noexcept -> bool {
      return !(*this == rhs);
    }
    auto hash() const noexcept -> size_t;

    // Print using binder names from `stk` (innermost last)
    // `stk` will be unchanged
    // O(size)
    auto toString(std::vector<std::string>& stk) const -> std::string;
    auto toString() const -> std::string {
      std::vector<std::string> stk;
      return toString(stk);
    }

    // Modification (lifetime of the resulting term is bounded by `this` and `pool`)
    // n = (number of binders on top of current node)
    template <typename F>
    auto updateVars(F f, Allocator<Term>& pool, uint64_t n = 0) const -> Term const* {
      using enum Tag; // These are needed to avoid ICE on gcc...
      using enum AllTag;
      using enum LamTag;
      using enum AppTag;
      using enum AnnTag;
      switch (tag) {
        case Var:
          return f(n, this);
        case Ref:
          return this;
        case Typ:
          return this;
        case All: {
          auto const t = all.t->updateVars(f, pool, n + 1);
          auto const r = all.r->updateVars(f, pool, n + 2);
          return (t == all.t && r == all.r) ? this : pool.make(AAll, all.e, all.self, all.s, t, r);
        }
        case Lam: {
          auto const r = lam.r->updateVars(f, pool, n + 1);
          return (r == lam.r) ? this : pool.make(LLam, lam.e, lam.s, r);
        }
        case App: {
          auto const l = app.l->updateVars(f, pool, n);
          auto const r = app.r->updateVars(f, pool, n);
          return (l == app.l && r == app.r) ? this : pool.make(AApp, app.e, l, r);
        }
        case Ann: {
          auto const t = ann.t->updateVars(f, pool, n);
          auto const x = ann.x->updateVars(f, pool, n);
          return (t == ann.t && x == ann.x) ? this : pool.make(AAnn, ann.c, t, x);
        }
      }
      unreachable;
    }

    // Adds `inc` to every variable whose index is at least `dep` (as seen from this node).
    // Lifetime of the resulting term is bounded by `this` and `pool`.
    auto shift(uint64_t inc, uint64_t dep, Allocator<Term>& pool) const -> Term const* {
      if (inc == 0)
        return this;
      return updateVars(
        [inc, dep, &pool](uint64_t n, Term const* x) -> Term const* {
          if (x->var.id >= dep + n)
            return pool.make(VVar, x->var.id + inc);
          return x;
        },
        pool
      );
    }

    // Replaces the variable at index `dep` by `v`, removing its binder: variables above it are decremented.
    // Under `n` more binders, `v` is shifted by `n` so that its own free variables are not captured.
    // Lifetime of the resulting term is bounded by `this`, `v` and `pool`.
    auto subst(Term const* v, uint64_t dep, Allocator<Term>& pool) const -> Term const* {
      return updateVars(
        [v, dep, &pool](uint64_t n, Term const* x) -> Term const* {
          if (x->var.id == dep + n)
            return v->shift(n, 0, pool);
          if (x->var.id > dep + n)
            return pool.make(VVar, x->var.id - 1);
          return x;
        },
        pool
      );
    }

    // Strips computationally irrelevant content: erased lambdas are instantiated with the `<erased>`
    // placeholder, erased arguments and type annotations are dropped.
    // Lifetime of the resulting term is bounded by `this` and `pool`.
    auto erase(Allocator<Term>& pool) const -> Term const*;

    // Returns the number of nodes of the term.
    auto size() const noexcept -> size_t;
  };

#include "macros_close.hpp"
}

#endif // SELFCORE_CORE_TERM_HPP
