#ifndef SELFCORE_EVAL_HOAS_HPP
#define SELFCORE_EVAL_HOAS_HPP

#include <functional>
#include <string>
#include <variant>
#include <common.hpp>
#include <core/term.hpp>

namespace selfcore::eval {
#include "macros_open.hpp"

  using core::Term;

  // Higher-order (closure) form of terms: binders are functions from already-built subterms to subterms,
  // so a beta step is a single call and needs no index bookkeeping.
  // Nodes live only as long as the `Bridge` that made them.
  class TermH;
  using Binder = std::function<TermH const*(TermH const*)>;
  using Binder2 = std::function<TermH const*(TermH const*, TermH const*)>;

  // clang-format off
  struct VarH   { uint64_t index; };                                    // Free variable, counted from outside the converted term
  struct LevelH { uint64_t level; };                                    // Placeholder for a binder at given depth (only made by `fromTermH`)
  struct RefH   { std::string name; };
  struct TypH   {};
  struct AllH   { bool e; std::string self, name; Binder dom; Binder2 cod; }; // dom(self), cod(self, param)
  struct LamH   { bool e; std::string name; Binder body; };
  struct AppH   { bool e; TermH const *f, *a; };
  struct AnnH   { bool c; TermH const *type, *term; };
  // clang-format on

  class TermH: public std::variant<VarH, LevelH, RefH, TypH, AllH, LamH, AppH, AnnH> {
  public:
    using variant::variant;
  };

  // Converts between de Bruijn terms and closure form, and owns every `TermH` node made in between.
  // Binder closures capture `this`, so a `Bridge` never moves.
  class Bridge {
  public:
    Bridge() = default;
    Bridge(Bridge const&) = delete;
    Bridge(Bridge&&) = delete;
    auto operator=(Bridge const&) -> Bridge& = delete;
    auto operator=(Bridge&&) -> Bridge& = delete;
    ~Bridge() = default;

    template <typename T>
    auto make(T&& node) -> TermH const* {
      return _nodes.make(std::forward<T>(node));
    }

    // Bound variables resolve to the values their binders get called with.
    auto toTermH(Term const* t) -> TermH const* {
      return _toTermH(nullptr, 0, t);
    }

    // Calls every binder with `LevelH` placeholders and turns them back into indices.
    // Lifetime of the resulting term is bounded by `pool`.
    auto fromTermH(TermH const* t, Allocator<Term>& pool) -> Term const* {
      return _fromTermH(0, t, pool);
    }

  private:
    // Persistent list of values for the open binders (innermost first).
    struct Env {
      TermH const* head;
      Env const* tail;
    };

    Allocator<TermH> _nodes;
    Allocator<Env> _envs;

    auto _toTermH(Env const* env, uint64_t n, Term const* t) -> TermH const*;
    auto _fromTermH(uint64_t dep, TermH const* t, Allocator<Term>& pool) -> Term const*;
  };

#include "macros_close.hpp"
}

#endif // SELFCORE_EVAL_HOAS_HPP
