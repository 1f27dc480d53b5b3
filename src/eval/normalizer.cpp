#include "normalizer.hpp"
#include "evaluator.hpp"

using std::string;
using std::get_if;

namespace selfcore::eval {
#include "macros_open.hpp"

  auto reduceTermH(Definitions const& defs, Bridge& bridge, TermH const* t) -> TermH const* {
    while (true) {
      if (auto const ref = get_if<RefH>(t)) {
        auto const res = unfold(ref->name, defs);
        if (!res) return t;
        t = bridge.toTermH(*res);
      } else if (auto const lam = get_if<LamH>(t); lam && lam->e) {
        // Erased parameters are never looked at: the real argument is not passed in
        t = lam->body(bridge.make(RefH{string(Term::erasedName)}));
      } else if (auto const app = get_if<AppH>(t)) {
        if (app->e) {
          t = app->f;
          continue;
        }
        auto const f = reduceTermH(defs, bridge, app->f);
        if (auto const g = get_if<LamH>(f)) {
          t = g->body(app->a);
          continue;
        }
        auto const a = reduceTermH(defs, bridge, app->a);
        return (f == app->f && a == app->a) ? t : bridge.make(AppH{false, f, a});
      } else if (auto const ann = get_if<AnnH>(t)) {
        t = ann->term;
      } else {
        return t;
      }
    }
  }

  auto normalizeTermH(Definitions const& defs, Bridge& bridge, TermH const* t) -> TermH const* {
    auto const w = reduceTermH(defs, bridge, t);
    return match(
      *w,
      [&](AllH const& x) -> TermH const* {
        auto const p = &x;
        return bridge.make(AllH{
          x.e,
          x.self,
          x.name,
          [&defs, &bridge, p](TermH const* s) { return normalizeTermH(defs, bridge, p->dom(s)); },
          [&defs, &bridge, p](TermH const* s, TermH const* y) { return normalizeTermH(defs, bridge, p->cod(s, y)); },
        });
      },
      [&](LamH const& x) -> TermH const* {
        auto const p = &x;
        return bridge.make(LamH{
          x.e,
          x.name,
          [&defs, &bridge, p](TermH const* y) { return normalizeTermH(defs, bridge, p->body(y)); },
        });
      },
      [&](AppH const& x) -> TermH const* {
        auto const f = normalizeTermH(defs, bridge, x.f);
        auto const a = normalizeTermH(defs, bridge, x.a);
        return (f == x.f && a == x.a) ? w : bridge.make(AppH{x.e, f, a});
      },
      [&](auto const&) -> TermH const* { return w; }
    );
  }

  auto reduce(Definitions const& defs, Term const* term, Allocator<Term>& pool) -> Term const* {
    auto bridge = Bridge();
    return bridge.fromTermH(reduceTermH(defs, bridge, bridge.toTermH(term)), pool);
  }

  auto normalize(Definitions const& defs, Term const* term, Allocator<Term>& pool) -> Term const* {
    auto bridge = Bridge();
    return bridge.fromTermH(normalizeTermH(defs, bridge, bridge.toTermH(term)), pool);
  }

#include "macros_close.hpp"
}
