#include "term.hpp"

using std::string;
using std::vector;

namespace selfcore::core {
#include "macros_open.hpp"

  auto Term::clone(Allocator<Term>& pool) const -> Term const* {
    switch (tag) {
      case Var: return pool.make(VVar, var.id);
      case Ref: return pool.make(RRef, ref.s);
      case Typ: return pool.make(TTyp);
      case All: return pool.make(AAll, all.e, all.self, all.s, all.t->clone(pool), all.r->clone(pool));
      case Lam: return pool.make(LLam, lam.e, lam.s, lam.r->clone(pool));
      case App: return pool.make(AApp, app.e, app.l->clone(pool), app.r->clone(pool));
      case Ann: return pool.make(AAnn, ann.c, ann.t->clone(pool), ann.x->clone(pool));
    }
    unreachable;
  }

  auto Term::operator==(Term const& rhs) const noexcept -> bool {
    if (this == &rhs) return true;
    if (tag != rhs.tag) return false;
    // Mid: tag == rhs.tag
    switch (tag) {
      case Var: return var.id == rhs.var.id;
      case Ref: return ref.s == rhs.ref.s;
      case Typ: return true;
      case All: return all.e == rhs.all.e && *all.t == *rhs.all.t && *all.r == *rhs.all.r; // Ignore bound variable names
      case Lam: return lam.e == rhs.lam.e && *lam.r == *rhs.lam.r;                         // Ignore bound variable names
      case App: return app.e == rhs.app.e && *app.l == *rhs.app.l && *app.r == *rhs.app.r;
      case Ann: return ann.c == rhs.ann.c && *ann.t == *rhs.ann.t && *ann.x == *rhs.ann.x;
    }
    unreachable;
  }

  auto Term::hash() const noexcept -> size_t {
    auto res = static_cast<size_t>(tag);
    switch (tag) {
      case Var: return combineHash(res, var.id);
      case Ref: return combineHash(res, ref.s);
      case Typ: return res;
      case All:
        // Ignore bound variable names
        res = combineHash(res, all.e);
        res = combineHash(res, all.t->hash());
        res = combineHash(res, all.r->hash());
        return res;
      case Lam:
        res = combineHash(res, lam.e);
        res = combineHash(res, lam.r->hash());
        return res;
      case App:
        res = combineHash(res, app.e);
        res = combineHash(res, app.l->hash());
        res = combineHash(res, app.r->hash());
        return res;
      case Ann:
        res = combineHash(res, ann.c);
        res = combineHash(res, ann.t->hash());
        res = combineHash(res, ann.x->hash());
        return res;
    }
    unreachable;
  }

  // Variables beyond the name stack are printed as `?b<k>`, with `k` counted from the outside of the stack.
  auto Term::toString(vector<string>& stk) const -> string {
    auto const sem = [](bool e) { return e ? string(";") : string(); };
    switch (tag) {
      case Var:
        if (var.id < stk.size()) return stk[stk.size() - 1 - var.id];
        return "?b" + std::to_string(var.id - stk.size());
      case Ref: return ref.s;
      case Typ: return "Type";
      case All: {
        string res = all.self + "(" + all.s + " : ";
        stk.push_back(all.self);
        res += all.t->toString(stk) + sem(all.e) + ") -> ";
        stk.push_back(all.s);
        res += all.r->toString(stk);
        stk.pop_back();
        stk.pop_back();
        return res;
      }
      case Lam: {
        string res = "(" + lam.s + sem(lam.e) + ") => ";
        stk.push_back(lam.s);
        res += lam.r->toString(stk);
        stk.pop_back();
        return res;
      }
      case App: {
        bool fl = (app.l->tag != Var && app.l->tag != Ref && app.l->tag != App);
        return (fl ? "(" : "") + app.l->toString(stk) + (fl ? ")" : "") + "(" + app.r->toString(stk) + sem(app.e) + ")";
      }
      case Ann: {
        bool fx = (ann.x->tag == All || ann.x->tag == Lam || ann.x->tag == Ann);
        return (fx ? "(" : "") + ann.x->toString(stk) + (fx ? ")" : "") + " :: " + ann.t->toString(stk);
      }
    }
    unreachable;
  }

  auto Term::erase(Allocator<Term>& pool) const -> Term const* {
    switch (tag) {
      case Var: return this;
      case Ref: return this;
      case Typ: return this;
      case All: {
        auto const t = all.t->erase(pool);
        auto const r = all.r->erase(pool);
        return (t == all.t && r == all.r) ? this : pool.make(AAll, all.e, all.self, all.s, t, r);
      }
      case Lam: {
        if (lam.e) return lam.r->subst(pool.make(RRef, string(erasedName)), 0, pool)->erase(pool);
        auto const r = lam.r->erase(pool);
        return (r == lam.r) ? this : pool.make(LLam, lam.e, lam.s, r);
      }
      case App: {
        if (app.e) return app.l->erase(pool);
        auto const l = app.l->erase(pool);
        auto const r = app.r->erase(pool);
        return (l == app.l && r == app.r) ? this : pool.make(AApp, app.e, l, r);
      }
      case Ann: return ann.x->erase(pool);
    }
    unreachable;
  }

  auto Term::size() const noexcept -> size_t {
    switch (tag) {
      case Var: return 1;
      case Ref: return 1;
      case Typ: return 1;
      case All: return 1 + all.t->size() + all.r->size();
      case Lam: return 1 + lam.r->size();
      case App: return 1 + app.l->size() + app.r->size();
      case Ann: return 1 + ann.t->size() + ann.x->size();
    }
    unreachable;
  }

#include "macros_close.hpp"
}
