#ifndef SELFCORE_PARSING_PARSER_HPP
#define SELFCORE_PARSING_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <core/module.hpp>
#include <core/term.hpp>
#include "stream.hpp"

namespace selfcore::parsing {
#include "macros_open.hpp"

  using core::Term;
  using core::Def;
  using core::Module;

  // Backtracking recursive-descent parser for the term syntax:
  //
  //   term := self? "(" name ":" term ";"? ")" "->" term   (dependent function type)
  //         | "(" name ";"? ")" "=>" term                  (function)
  //         | "Type"
  //         | name                                        (bound variable or reference)
  //         | "(" term ")"
  //   followed by any number of applications `(term ;?)` and an optional annotation `:: term`.
  //   def  := name ":" term term
  //
  // A trailing `;` marks the binder or argument as erased. `//` and `/* */` comments count as whitespace.
  // Each parsing function either succeeds, or fails without consuming any input.
  class Parser {
  public:
    // Resulting terms are allocated in `pool`.
    Parser(std::string s, Allocator<Term>& pool):
        _stream(std::move(s)),
        _pool(pool) {}

    // `names` = names of the enclosing binders (innermost last); will be unchanged.
    auto term(std::vector<std::string>& names) -> std::optional<Term const*>;
    auto def() -> std::optional<Def>;

    // Skips whitespace and comments.
    auto space() -> void;
    auto eof() const -> bool {
      return !_stream.peek();
    }

  private:
    CharStream _stream;
    Allocator<Term>& _pool;

    auto _string(std::string_view s) -> bool;
    auto _sym(std::string_view s) -> bool;
    auto _opt(Char c) -> bool;
    auto _name() -> std::optional<std::string>;

    auto _all(std::vector<std::string>& names) -> std::optional<Term const*>;
    auto _lam(std::vector<std::string>& names) -> std::optional<Term const*>;
    auto _typ() -> std::optional<Term const*>;
    auto _var(std::vector<std::string>& names) -> std::optional<Term const*>;
    auto _par(std::vector<std::string>& names) -> std::optional<Term const*>;
    auto _app(std::vector<std::string>& names, Term const* f) -> std::optional<Term const*>;
    auto _ann(std::vector<std::string>& names, Term const* x) -> std::optional<Term const*>;
  };

  // These fail unless the whole input (up to trailing whitespace and comments) is consumed.
  auto parseTerm(std::string const& s, Allocator<Term>& pool, std::vector<std::string> names = {})
    -> std::optional<Term const*>;
  auto parseDef(std::string const& s, Allocator<Term>& pool) -> std::optional<Def>;
  auto parseModule(std::string const& s) -> std::optional<Module>;

#include "macros_close.hpp"
}

#endif // SELFCORE_PARSING_PARSER_HPP
