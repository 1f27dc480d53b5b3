#include "evaluator.hpp"

using std::string;
using std::optional;

namespace selfcore::eval {
#include "macros_open.hpp"

  using enum Term::Tag;
  using enum Term::RefTag;
  using enum Term::AppTag;

  auto unfold(string const& name, Definitions const& defs) -> optional<Term const*> {
    auto const def = defs.lookup(name);
    if (!def) return {};
    if (def->term->tag == Ref && def->term->ref.s == name) return {};
    return def->term;
  }

  auto deref(string const& name, Definitions const& defs, Allocator<Term>& pool) -> Term const* {
    if (auto const res = unfold(name, defs)) return *res;
    return pool.make(RRef, name);
  }

  auto evalTerm(Term const* term, Definitions const& defs, Allocator<Term>& pool) -> Term const* {
    auto t = term;
    while (true) {
      switch (t->tag) {
        case Var: return t;
        case Typ: return t;
        case All: return t;
        case Lam:
          if (!t->lam.e) return t;
          t = t->lam.r->subst(pool.make(RRef, string(Term::erasedName)), 0, pool);
          continue;
        case App: {
          if (t->app.e) {
            t = t->app.l;
            continue;
          }
          auto const f = evalTerm(t->app.l, defs, pool);
          if (f->tag == Lam) {
            t = f->lam.r->subst(t->app.r, 0, pool);
            continue;
          }
          auto const a = evalTerm(t->app.r, defs, pool);
          return (f == t->app.l && a == t->app.r) ? t : pool.make(AApp, false, f, a);
        }
        case Ref: {
          auto const res = unfold(t->ref.s, defs);
          if (!res) return t;
          t = *res;
          continue;
        }
        case Ann:
          t = t->ann.x;
          continue;
      }
      unreachable;
    }
  }

#include "macros_close.hpp"
}
