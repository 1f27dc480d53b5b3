#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <core/module.hpp>
#include <core/term.hpp>
#include <eval/evaluator.hpp>
#include <eval/hoas.hpp>
#include <eval/normalizer.hpp>
#include <parsing/parser.hpp>

using std::string;
using std::vector;
using namespace selfcore;
using core::Term;
using core::Def;
using core::Module;

namespace {

  auto const prelude = R"(
    // Polymorphic identity
    id : (A : Type) -> (a : A) -> A
    (A) => (a) => a

    two : Type
    (f) => (x) => f(f(x))

    add : Type
    (m) => (n) => (f) => (x) => m(f)(n(f)(x))

    /* Defined as itself */
    loop : Type
    loop

    alias : Type
    id
  )";

  auto parse(string const& s, Allocator<Term>& pool, vector<string> names = {}) -> Term const* {
    auto const res = parsing::parseTerm(s, pool, std::move(names));
    if (!res) throw std::invalid_argument("could not parse: " + s);
    return *res;
  }

  // Definition source that records every name it is asked for.
  class Recording: public core::Definitions {
  public:
    explicit Recording(Module const& module):
        _module(module) {}

    auto lookup(string const& name) const -> Def const* override {
      queried.push_back(name);
      return _module.lookup(name);
    }

    auto asked(string const& name) const -> bool {
      return std::find(queried.begin(), queried.end(), name) != queried.end();
    }

    mutable vector<string> queried;

  private:
    Module const& _module;
  };

  class Eval: public testing::Test {
  protected:
    Module defs = parsing::parseModule(prelude).value();
    Allocator<Term> pool;
  };

}

TEST_F(Eval, PreludeParses) {
  EXPECT_EQ(defs.size(), 5u);
  EXPECT_EQ(defs[0].name, "id");
  EXPECT_EQ(defs[4].name, "alias");
}

TEST_F(Eval, PolymorphicIdentity) {
  auto const t = parse("id(Type)(Type)", pool);
  EXPECT_EQ(*eval::normalize(defs, t, pool), *parse("Type", pool));
  EXPECT_EQ(*eval::evalTerm(t, defs, pool), *parse("Type", pool));
  EXPECT_EQ(*eval::normalize(defs, parse("alias(Type)(Type)", pool), pool), *parse("Type", pool));
}

TEST_F(Eval, ChurchAddition) {
  auto const t = parse("add(two)(two)", pool);
  EXPECT_EQ(*eval::normalize(defs, t, pool), *parse("(f) => (x) => f(f(f(f(x))))", pool));
}

TEST_F(Eval, EvalAgreesWithReduce) {
  auto const cases = vector<Term const*>{
    parse("id(Type)(Type)", pool),
    parse("id(Type)", pool),
    parse("add(two)", pool),
    parse("alias", pool),
    parse("loop", pool),
    parse("Type :: Type", pool),
    parse("f(((x) => x)(Type))", pool),
    parse("((x;) => x)(Type;)", pool),
    parse("(x) => ((y) => y)(x)", pool),
    parse("((x) => (y) => x)(z)", pool, {"z"}),
    parse("z(id(Type)(Type))(w)", pool, {"z", "w"}),
    parse("s(x : id(Type)(s)) -> s", pool),
  };
  for (auto const t: cases) {
    EXPECT_EQ(*eval::evalTerm(t, defs, pool), *eval::reduce(defs, t, pool)) << t->toString();
  }
}

TEST_F(Eval, NormalizeIsIdempotent) {
  auto const cases = vector<Term const*>{
    parse("add(two)(two)", pool),
    parse("add(two)", pool),
    parse("(x) => ((y) => y)(x)", pool),
    parse("s(x : id(Type)(s)) -> id(Type)(x)", pool),
    parse("f(((x) => x)(Type))", pool),
  };
  for (auto const t: cases) {
    auto const n = eval::normalize(defs, t, pool);
    EXPECT_EQ(*eval::normalize(defs, n, pool), *n) << t->toString();
  }
}

TEST_F(Eval, EvalDoesNotEnterBinders) {
  auto const t = parse("(x) => ((y) => y)(x)", pool);
  EXPECT_EQ(eval::evalTerm(t, defs, pool), t);
  EXPECT_EQ(*eval::normalize(defs, t, pool), *parse("(x) => x", pool));
}

TEST_F(Eval, NormalizeUnderSelfBinder) {
  auto const t = parse("s(x : id(Type)(s)) -> id(Type)(x)", pool);
  EXPECT_EQ(*eval::normalize(defs, t, pool), *parse("s(x : s) -> x", pool));
}

TEST_F(Eval, FreeVariablesSurvive) {
  auto const t = parse("((x) => (y) => x)(z)", pool, {"z"});
  auto const expected = parse("(y) => z", pool, {"z"});
  EXPECT_EQ(*eval::evalTerm(t, defs, pool), *expected);
  EXPECT_EQ(*eval::normalize(defs, t, pool), *expected);
}

TEST_F(Eval, StuckApplicationReducesArgument) {
  auto const t = parse("f(((x) => x)(Type))", pool);
  EXPECT_EQ(*eval::evalTerm(t, defs, pool), *parse("f(Type)", pool));
  auto const u = parse("z(id(Type)(Type))", pool, {"z"});
  EXPECT_EQ(*eval::evalTerm(u, defs, pool), *parse("z(Type)", pool, {"z"}));
}

TEST_F(Eval, SelfAliasIsStuck) {
  EXPECT_FALSE(eval::unfold("loop", defs).has_value());
  EXPECT_FALSE(eval::unfold("nothing", defs).has_value());
  EXPECT_TRUE(eval::unfold("id", defs).has_value());
  EXPECT_EQ(*eval::deref("nothing", defs, pool), *parse("nothing", pool));
  auto const t = parse("loop", pool);
  EXPECT_EQ(*eval::evalTerm(t, defs, pool), *t);
  EXPECT_EQ(*eval::normalize(defs, t, pool), *t);
}

TEST_F(Eval, ErasedArgumentIsNeverLookedUp) {
  auto const t = parse("((x;) => x)(missing;)", pool);
  auto const placeholder = pool.make(Term::RRef, string(Term::erasedName));
  {
    auto const rec = Recording(defs);
    EXPECT_EQ(*eval::evalTerm(t, rec, pool), *placeholder);
    EXPECT_FALSE(rec.asked("missing"));
  }
  {
    auto const rec = Recording(defs);
    EXPECT_EQ(*eval::normalize(rec, t, pool), *placeholder);
    EXPECT_FALSE(rec.asked("missing"));
  }
  EXPECT_EQ(*t->erase(pool), *placeholder);
}

TEST_F(Eval, ErasedLambdaIsInstantiated) {
  auto const t = parse("((A;) => (a) => a)(Type;)", pool);
  EXPECT_EQ(*eval::normalize(defs, t, pool), *parse("(a) => a", pool));
  EXPECT_EQ(*eval::evalTerm(t, defs, pool), *parse("(a) => a", pool));
}

TEST_F(Eval, AnnotationsAreTransparent) {
  auto const t = parse("(id :: (A : Type) -> (a : A) -> A)(Type)(Type)", pool);
  EXPECT_EQ(*eval::evalTerm(t, defs, pool), *parse("Type", pool));
  EXPECT_EQ(*eval::normalize(defs, t, pool), *parse("Type", pool));
}

TEST(Bridge, RoundTrip) {
  auto pool = Allocator<Term>();
  auto const cases = vector<Term const*>{
    parse("Type", pool),
    parse("(x) => (y;) => x(y)", pool),
    parse("s(x : s) -> (A : Type;) -> s(x)(A)", pool),
    parse("(f) => (x) => f(f(x) :: Type)", pool),
    parse("a((x) => b(x))", pool, {"a", "b"}),
    parse("p(x : q) -> x(p)(q)", pool, {"q"}),
  };
  for (auto const t: cases) {
    auto bridge = eval::Bridge();
    EXPECT_EQ(*bridge.fromTermH(bridge.toTermH(t), pool), *t) << t->toString();
  }
}
