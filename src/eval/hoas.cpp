#include "hoas.hpp"

namespace selfcore::eval {
#include "macros_open.hpp"

  using enum Term::Tag;
  using enum Term::VarTag;
  using enum Term::RefTag;
  using enum Term::TypTag;
  using enum Term::AllTag;
  using enum Term::LamTag;
  using enum Term::AppTag;
  using enum Term::AnnTag;

  // `n` = length of `env`
  auto Bridge::_toTermH(Env const* env, uint64_t n, Term const* t) -> TermH const* {
    switch (t->tag) {
      case Var: {
        if (t->var.id >= n) return make(VarH{t->var.id - n});
        auto it = env;
        for (auto i = 0uz; i < t->var.id; i++) it = it->tail;
        return it->head;
      }
      case Ref: return make(RefH{t->ref.s});
      case Typ: return make(TypH{});
      case All:
        return make(AllH{
          t->all.e,
          t->all.self,
          t->all.s,
          [this, env, n, t](TermH const* x) { return _toTermH(_envs.make(Env{x, env}), n + 1, t->all.t); },
          [this, env, n, t](TermH const* x, TermH const* y) {
            return _toTermH(_envs.make(Env{y, _envs.make(Env{x, env})}), n + 2, t->all.r);
          },
        });
      case Lam:
        return make(LamH{
          t->lam.e,
          t->lam.s,
          [this, env, n, t](TermH const* x) { return _toTermH(_envs.make(Env{x, env}), n + 1, t->lam.r); },
        });
      case App: return make(AppH{t->app.e, _toTermH(env, n, t->app.l), _toTermH(env, n, t->app.r)});
      case Ann: return make(AnnH{t->ann.c, _toTermH(env, n, t->ann.t), _toTermH(env, n, t->ann.x)});
    }
    unreachable;
  }

  // A placeholder made at level `l` and met at depth `dep` is the variable with index `dep - l - 1`.
  auto Bridge::_fromTermH(uint64_t dep, TermH const* t, Allocator<Term>& pool) -> Term const* {
    return match(
      *t,
      [&](VarH const& x) -> Term const* { return pool.make(VVar, x.index + dep); },
      [&](LevelH const& x) -> Term const* {
        assert(x.level < dep);
        return pool.make(VVar, dep - x.level - 1);
      },
      [&](RefH const& x) -> Term const* { return pool.make(RRef, x.name); },
      [&](TypH const&) -> Term const* { return pool.make(TTyp); },
      [&](AllH const& x) -> Term const* {
        auto const self = make(LevelH{dep});
        auto const param = make(LevelH{dep + 1});
        auto const dom = _fromTermH(dep + 1, x.dom(self), pool);
        auto const cod = _fromTermH(dep + 2, x.cod(self, param), pool);
        return pool.make(AAll, x.e, x.self, x.name, dom, cod);
      },
      [&](LamH const& x) -> Term const* {
        auto const body = _fromTermH(dep + 1, x.body(make(LevelH{dep})), pool);
        return pool.make(LLam, x.e, x.name, body);
      },
      [&](AppH const& x) -> Term const* {
        return pool.make(AApp, x.e, _fromTermH(dep, x.f, pool), _fromTermH(dep, x.a, pool));
      },
      [&](AnnH const& x) -> Term const* {
        return pool.make(AAnn, x.c, _fromTermH(dep, x.type, pool), _fromTermH(dep, x.term, pool));
      }
    );
  }

#include "macros_close.hpp"
}
