#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <core/module.hpp>
#include <core/term.hpp>

using std::string;
using namespace selfcore;
using core::Term;
using core::Def;
using core::Module;
using enum Term::VarTag;
using enum Term::RefTag;
using enum Term::TypTag;
using enum Term::AllTag;
using enum Term::LamTag;
using enum Term::AppTag;
using enum Term::AnnTag;

#define N(...)              pool.make(__VA_ARGS__)
#define var(id)             N(VVar, id)
#define ref(s)              N(RRef, s)
#define typ                 N(TTyp)
#define all(self, s, t, r)  N(AAll, false, self, s, t, r)
#define lam(s, r)           N(LLam, false, s, r)
#define elam(s, r)          N(LLam, true, s, r)
#define app(l, r)           N(AApp, false, l, r)
#define eapp(l, r)          N(AApp, true, l, r)
#define ann(t, x)           N(AAnn, false, t, x)

TEST(Term, ShiftRespectsCutoff) {
  auto pool = Allocator<Term>();
  EXPECT_EQ(*var(0)->shift(1, 0, pool), *var(1));
  EXPECT_EQ(*var(0)->shift(1, 1, pool), *var(0));
  EXPECT_EQ(*var(3)->shift(2, 1, pool), *var(5));
  // Bound occurrences stay, free ones move
  EXPECT_EQ(*lam("x", app(var(0), var(1)))->shift(1, 0, pool), *lam("x", app(var(0), var(2))));
}

TEST(Term, ShiftByZeroIsIdentity) {
  auto pool = Allocator<Term>();
  auto const t = lam("x", app(var(0), var(4)));
  EXPECT_EQ(t->shift(0, 0, pool), t);
}

TEST(Term, ShiftUnchangedReturnsSameNode) {
  auto pool = Allocator<Term>();
  auto const t = lam("x", app(var(0), ref("f")));
  EXPECT_EQ(t->shift(3, 0, pool), t);
}

TEST(Term, ShiftSelfBinderDepths) {
  auto pool = Allocator<Term>();
  // Domain is under one binder (self), codomain under two (self, parameter)
  auto const closed = all("s", "x", var(0), app(var(1), var(0)));
  EXPECT_EQ(closed->shift(1, 0, pool), closed);
  auto const open = all("s", "x", var(1), var(2));
  EXPECT_EQ(*open->shift(1, 0, pool), *all("s", "x", var(2), var(3)));
}

TEST(Term, ShiftComposes) {
  auto pool = Allocator<Term>();
  auto const terms = std::vector<Term const*>{
    var(0),
    var(7),
    lam("x", app(var(1), var(0))),
    all("s", "x", app(var(0), var(1)), app(var(2), var(3))),
    ann(typ, lam("y", var(2))),
  };
  for (auto const t: terms) {
    for (uint64_t d = 0; d < 3; d++) {
      EXPECT_EQ(*t->shift(2, d, pool)->shift(3, d, pool), *t->shift(5, d, pool)) << t->toString();
    }
  }
}

TEST(Term, SubstReplacesAndDecrements) {
  auto pool = Allocator<Term>();
  EXPECT_EQ(*var(0)->subst(ref("a"), 0, pool), *ref("a"));
  EXPECT_EQ(*var(2)->subst(ref("a"), 0, pool), *var(1));
  EXPECT_EQ(*var(0)->subst(ref("a"), 1, pool), *var(0));
  // The value is shifted by the number of binders it goes under
  EXPECT_EQ(*lam("x", app(var(1), var(0)))->subst(var(3), 0, pool), *lam("x", app(var(4), var(0))));
}

TEST(Term, SubstSelfBinderDepths) {
  auto pool = Allocator<Term>();
  auto const t = all("s", "x", app(var(0), var(1)), app(var(1), var(2)));
  EXPECT_EQ(*t->subst(ref("a"), 0, pool), *all("s", "x", app(var(0), ref("a")), app(var(1), ref("a"))));
  EXPECT_EQ(*t->subst(var(0), 0, pool), *all("s", "x", app(var(0), var(1)), app(var(1), var(2))));
}

TEST(Term, SubstAfterShiftCancels) {
  auto pool = Allocator<Term>();
  auto const t = lam("x", app(var(0), all("s", "y", var(2), var(3))));
  EXPECT_EQ(*t->shift(1, 0, pool)->subst(ref("v"), 0, pool), *t);
}

TEST(Term, EqualityIgnoresBinderNames) {
  auto pool = Allocator<Term>();
  auto const a = all("s", "x", typ, lam("y", var(0)));
  auto const b = all("t", "z", typ, lam("w", var(0)));
  EXPECT_EQ(*a, *b);
  EXPECT_EQ(a->hash(), b->hash());
  EXPECT_NE(*lam("x", var(0)), *elam("x", var(0)));
  EXPECT_NE(*app(ref("f"), typ), *eapp(ref("f"), typ));
  EXPECT_NE(*ref("a"), *ref("b"));
}

TEST(Term, CloneIsDeep) {
  auto pool = Allocator<Term>();
  auto other = Allocator<Term>();
  auto const t = all("s", "x", typ, ann(typ, app(lam("y", var(0)), ref("a"))));
  auto const c = t->clone(other);
  EXPECT_NE(c, t);
  EXPECT_EQ(*c, *t);
  EXPECT_EQ(c->size(), t->size());
}

TEST(Term, Size) {
  auto pool = Allocator<Term>();
  EXPECT_EQ(typ->size(), 1u);
  EXPECT_EQ(app(lam("x", var(0)), ann(typ, ref("a")))->size(), 6u);
}

TEST(Term, EraseDropsIrrelevantParts) {
  auto pool = Allocator<Term>();
  EXPECT_EQ(*eapp(ref("f"), ref("missing"))->erase(pool), *ref("f"));
  EXPECT_EQ(*ann(typ, ref("a"))->erase(pool), *ref("a"));
  EXPECT_EQ(*elam("x", var(0))->erase(pool), *ref(string(Term::erasedName)));
  // Nested erased lambda: the outer one is still bound correctly after instantiating the inner one
  EXPECT_EQ(*lam("A", elam("x", var(1)))->erase(pool), *lam("A", var(0)));
  EXPECT_EQ(*all("s", "x", ann(typ, typ), eapp(var(0), typ))->erase(pool), *all("s", "x", typ, var(0)));
}

TEST(Term, EraseUnchangedReturnsSameNode) {
  auto pool = Allocator<Term>();
  auto const t = lam("x", app(var(0), ref("a")));
  EXPECT_EQ(t->erase(pool), t);
}

TEST(Term, ToString) {
  auto pool = Allocator<Term>();
  EXPECT_EQ(lam("x", var(0))->toString(), "(x) => x");
  EXPECT_EQ(elam("x", var(0))->toString(), "(x;) => x");
  EXPECT_EQ(app(ref("f"), ref("a"))->toString(), "f(a)");
  EXPECT_EQ(eapp(ref("f"), ref("a"))->toString(), "f(a;)");
  EXPECT_EQ(app(lam("x", var(0)), typ)->toString(), "((x) => x)(Type)");
  EXPECT_EQ(all("s", "x", typ, var(1))->toString(), "s(x : Type) -> s");
  EXPECT_EQ(all("", "A", typ, all("", "a", var(1), var(2)))->toString(), "(A : Type) -> (a : A) -> A");
  EXPECT_EQ(ann(typ, lam("x", var(0)))->toString(), "((x) => x) :: Type");
  EXPECT_EQ(var(2)->toString(), "?b2");
}

TEST(Module, AddAndLookup) {
  auto pool = Allocator<Term>();
  auto m = Module();
  EXPECT_EQ(m.add(Def{"id", typ, lam("x", var(0))}), 0u);
  EXPECT_EQ(m.add(Def{"T", typ, typ}), 1u);
  ASSERT_NE(m.lookup("id"), nullptr);
  EXPECT_EQ(*m.lookup("id")->term, *lam("x", var(0)));
  EXPECT_EQ(m.lookup("nothing"), nullptr);
  EXPECT_EQ(m.size(), 2u);
}

TEST(Module, StoresCopies) {
  auto m = Module();
  {
    auto pool = Allocator<Term>();
    m.add(Def{"a", typ, app(ref("f"), typ)});
  }
  auto pool = Allocator<Term>();
  EXPECT_EQ(*m.lookup("a")->term, *app(ref("f"), typ));
}

TEST(Module, RedefinitionKeepsPosition) {
  auto pool = Allocator<Term>();
  auto m = Module();
  m.add(Def{"a", typ, typ});
  m.add(Def{"b", typ, typ});
  EXPECT_EQ(m.add(Def{"a", typ, ref("b")}), 0u);
  EXPECT_EQ(m.size(), 2u);
  EXPECT_EQ(m[0].name, "a");
  EXPECT_EQ(*m[0].term, *ref("b"));
  EXPECT_EQ(m.toString(), "a : Type\nb\n\nb : Type\nType");
}
