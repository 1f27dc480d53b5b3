#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <core/module.hpp>
#include <core/term.hpp>
#include <parsing/parser.hpp>

using std::string;
using std::vector;
using namespace selfcore;
using core::Term;
using parsing::parseTerm;
using parsing::parseDef;
using parsing::parseModule;
using enum Term::VarTag;
using enum Term::RefTag;
using enum Term::TypTag;
using enum Term::AllTag;
using enum Term::LamTag;
using enum Term::AppTag;
using enum Term::AnnTag;

TEST(Parser, Atoms) {
  auto pool = Allocator<Term>();
  EXPECT_EQ(*parseTerm("Type", pool).value(), *pool.make(TTyp));
  EXPECT_EQ(*parseTerm("foo", pool).value(), *pool.make(RRef, "foo"));
  // `Type` is only a keyword on its own
  EXPECT_EQ(*parseTerm("Types", pool).value(), *pool.make(RRef, "Types"));
  EXPECT_EQ(*parseTerm("x", pool, {"x", "y"}).value(), *pool.make(VVar, 1));
  EXPECT_EQ(*parseTerm("  ( ( x ) )  ", pool, {"x"}).value(), *pool.make(VVar, 0));
}

TEST(Parser, Binders) {
  auto pool = Allocator<Term>();
  auto const id = parseTerm("(x) => x", pool).value();
  EXPECT_EQ(*id, *pool.make(LLam, false, "x", pool.make(VVar, 0)));
  auto const k = parseTerm("(x;) => (y) => x", pool).value();
  EXPECT_EQ(*k, *pool.make(LLam, true, "x", pool.make(LLam, false, "y", pool.make(VVar, 1))));
  // Self is bound in the domain; self and the parameter in the codomain
  auto const t = parseTerm("s(x : s) -> x(s)", pool).value();
  auto const expected = pool.make(
    AAll, false, "s", "x", pool.make(VVar, 0), pool.make(AApp, false, pool.make(VVar, 0), pool.make(VVar, 1))
  );
  EXPECT_EQ(*t, *expected);
  EXPECT_EQ(t->all.self, "s");
  EXPECT_EQ(t->all.s, "x");
  auto const e = parseTerm("(A : Type;) -> A", pool).value();
  EXPECT_TRUE(e->all.e);
  EXPECT_EQ(e->all.self, "");
}

TEST(Parser, ApplicationAndAnnotation) {
  auto pool = Allocator<Term>();
  auto const f = pool.make(RRef, "f");
  auto const a = pool.make(RRef, "a");
  auto const b = pool.make(RRef, "b");
  EXPECT_EQ(*parseTerm("f(a)(b;)", pool).value(), *pool.make(AApp, true, pool.make(AApp, false, f, a), b));
  EXPECT_EQ(*parseTerm("f(a) :: Type", pool).value(), *pool.make(AAnn, false, pool.make(TTyp), pool.make(AApp, false, f, a)));
  // Lambda bodies extend as far as possible
  auto const l = parseTerm("(x) => x(a)", pool).value();
  EXPECT_EQ(l->tag, Term::Lam);
  EXPECT_EQ(l->lam.r->tag, Term::App);
}

TEST(Parser, Comments) {
  auto pool = Allocator<Term>();
  auto const t = parseTerm("// leading\n(x) => /* inner */ x // trailing", pool);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(**t, *parseTerm("(x) => x", pool).value());
}

TEST(Parser, Failures) {
  auto pool = Allocator<Term>();
  EXPECT_FALSE(parseTerm("", pool).has_value());
  EXPECT_FALSE(parseTerm("(x) =>", pool).has_value());
  EXPECT_FALSE(parseTerm("(x", pool).has_value());
  EXPECT_FALSE(parseTerm("f(a", pool).has_value());
  EXPECT_FALSE(parseTerm("a b", pool).has_value());
  EXPECT_FALSE(parseTerm("(x : Type) ->", pool).has_value());
  EXPECT_FALSE(parseTerm("x /* unterminated", pool).has_value());
  EXPECT_FALSE(parseDef("name Type Type", pool).has_value());
  EXPECT_FALSE(parseModule("a : Type Type\nb :").has_value());
}

TEST(Parser, PrintedFormsReparse) {
  auto pool = Allocator<Term>();
  auto const sources = vector<string>{
    "(A : Type) -> (a : A) -> A",
    "s(x : s) -> (y : Type;) -> s(x)(y;)",
    "((x) => x)(Type)",
    "(f;) => (x) => f(f(x) :: Type)",
    "((x) => x) :: (A : Type) -> A",
    "f((x) => x)(g(Type);)",
    "(((a) => a) :: Type) :: Type",
  };
  for (auto const& s: sources) {
    auto const t = parseTerm(s, pool);
    ASSERT_TRUE(t.has_value()) << s;
    auto const printed = (*t)->toString();
    auto const u = parseTerm(printed, pool);
    ASSERT_TRUE(u.has_value()) << printed;
    EXPECT_EQ(**u, **t) << printed;
  }
}

TEST(Parser, Definition) {
  auto pool = Allocator<Term>();
  auto const d = parseDef("id : (A : Type) -> (a : A) -> A\n(A) => (a) => a", pool);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->name, "id");
  EXPECT_EQ(d->type->tag, Term::All);
  EXPECT_EQ(*d->term, *parseTerm("(A) => (a) => a", pool).value());
  EXPECT_EQ(d->toString(), "id : (A : Type) -> (a : A) -> A\n(A) => (a) => a");
}

TEST(Parser, ModuleKeepsOrder) {
  auto const m = parseModule(
    "// Definitions\n"
    "zero : Type\n(f) => (x) => x\n\n"
    "one : Type\n(f) => (x) => f(x)\n\n"
    "/* Depends on the others */\n"
    "both : Type\nzero(one)\n"
  );
  ASSERT_TRUE(m.has_value());
  ASSERT_EQ(m->size(), 3u);
  EXPECT_EQ((*m)[0].name, "zero");
  EXPECT_EQ((*m)[1].name, "one");
  EXPECT_EQ((*m)[2].name, "both");
  // The printed module reads back to the same module
  auto const again = parseModule(m->toString());
  ASSERT_TRUE(again.has_value());
  ASSERT_EQ(again->size(), 3u);
  for (auto i = 0uz; i < 3; i++) {
    EXPECT_EQ((*again)[i].name, (*m)[i].name);
    EXPECT_EQ(*(*again)[i].type, *(*m)[i].type);
    EXPECT_EQ(*(*again)[i].term, *(*m)[i].term);
  }
}

TEST(Parser, EmptyModule) {
  auto const m = parseModule("  // nothing here\n");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->size(), 0u);
}
