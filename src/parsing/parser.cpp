#include "parser.hpp"

using std::string;
using std::string_view;
using std::vector;
using std::optional;

namespace selfcore::parsing {
#include "macros_open.hpp"

  using enum Term::VarTag;
  using enum Term::RefTag;
  using enum Term::TypTag;
  using enum Term::AllTag;
  using enum Term::LamTag;
  using enum Term::AppTag;
  using enum Term::AnnTag;

  auto Parser::_string(string_view s) -> bool {
    auto const pos = _stream.position();
    for (auto const c: s) {
      if (_stream.advance() != static_cast<Char>(c)) {
        _stream.revert(pos);
        return false;
      }
    }
    return true;
  }

  auto Parser::_sym(string_view s) -> bool {
    if (!_string(s)) return false;
    space();
    return true;
  }

  auto Parser::_opt(Char c) -> bool {
    if (_stream.peek() != c) return false;
    _stream.advance();
    return true;
  }

  auto Parser::_name() -> optional<string> {
    auto const begin = _stream.position();
    while (_stream.peek() && isNameChar(*_stream.peek())) _stream.advance();
    if (_stream.position() == begin) return {};
    return string(_stream.slice(begin, _stream.position()));
  }

  auto Parser::space() -> void {
    while (auto const c = _stream.peek()) {
      if (isSpace(*c)) {
        _stream.advance();
      } else if (_string("//")) {
        while (_stream.peek() && *_stream.peek() != '\n') _stream.advance();
      } else if (auto const pos = _stream.position(); _string("/*")) {
        while (!_string("*/")) {
          if (!_stream.advance()) {
            // Unterminated comment is not whitespace
            _stream.revert(pos);
            return;
          }
        }
      } else {
        return;
      }
    }
  }

  auto Parser::term(vector<string>& names) -> optional<Term const*> {
    auto t = _all(names);
    if (!t) t = _lam(names);
    if (!t) t = _typ();
    if (!t) t = _var(names);
    if (!t) t = _par(names);
    if (!t) return {};
    if (auto const a = _app(names, *t)) t = a;
    if (auto const a = _ann(names, *t)) t = a;
    return t;
  }

  auto Parser::_all(vector<string>& names) -> optional<Term const*> {
    auto const pos = _stream.position();
    auto const fail = [this, pos]() {
      _stream.revert(pos);
      return optional<Term const*>();
    };
    auto const self = _name().value_or("");
    if (!_sym("(")) return fail();
    auto const s = _name();
    if (!s) return fail();
    space();
    if (!_sym(":")) return fail();
    names.push_back(self);
    auto const t = term(names);
    names.pop_back();
    if (!t) return fail();
    space();
    auto const e = _opt(';');
    space();
    if (!_sym(")") || !_sym("->")) return fail();
    names.push_back(self);
    names.push_back(*s);
    auto const r = term(names);
    names.pop_back();
    names.pop_back();
    if (!r) return fail();
    return _pool.make(AAll, e, self, *s, *t, *r);
  }

  auto Parser::_lam(vector<string>& names) -> optional<Term const*> {
    auto const pos = _stream.position();
    auto const fail = [this, pos]() {
      _stream.revert(pos);
      return optional<Term const*>();
    };
    if (!_sym("(")) return fail();
    auto const s = _name();
    if (!s) return fail();
    space();
    auto const e = _opt(';');
    space();
    if (!_sym(")") || !_sym("=>")) return fail();
    names.push_back(*s);
    auto const r = term(names);
    names.pop_back();
    if (!r) return fail();
    return _pool.make(LLam, e, *s, *r);
  }

  // `Type` is a keyword only when not followed by more name characters.
  auto Parser::_typ() -> optional<Term const*> {
    auto const pos = _stream.position();
    if (!_string("Type")) return {};
    if (_stream.peek() && isNameChar(*_stream.peek())) {
      _stream.revert(pos);
      return {};
    }
    return _pool.make(TTyp);
  }

  // Innermost binder wins; unbound names are references.
  auto Parser::_var(vector<string>& names) -> optional<Term const*> {
    auto const s = _name();
    if (!s) return {};
    // Unsigned count down: https://nachtimwald.com/2019/06/02/unsigned-count-down/
    for (size_t i = names.size(); i-- > 0;)
      if (names[i] == *s) return _pool.make(VVar, names.size() - 1 - i);
    return _pool.make(RRef, *s);
  }

  auto Parser::_par(vector<string>& names) -> optional<Term const*> {
    auto const pos = _stream.position();
    if (!_sym("(")) return {};
    auto const t = term(names);
    space();
    if (!t || !_string(")")) {
      _stream.revert(pos);
      return {};
    }
    return t;
  }

  auto Parser::_app(vector<string>& names, Term const* f) -> optional<Term const*> {
    auto res = optional<Term const*>();
    while (true) {
      auto const pos = _stream.position();
      if (!_sym("(")) break;
      auto const a = term(names);
      if (!a) {
        _stream.revert(pos);
        break;
      }
      space();
      auto const e = _opt(';');
      space();
      if (!_string(")")) {
        _stream.revert(pos);
        break;
      }
      f = _pool.make(AApp, e, f, *a);
      res = f;
    }
    return res;
  }

  auto Parser::_ann(vector<string>& names, Term const* x) -> optional<Term const*> {
    auto const pos = _stream.position();
    space();
    if (!_sym("::")) {
      _stream.revert(pos);
      return {};
    }
    auto const t = term(names);
    if (!t) {
      _stream.revert(pos);
      return {};
    }
    return _pool.make(AAnn, false, *t, x);
  }

  auto Parser::def() -> optional<Def> {
    auto const pos = _stream.position();
    auto const fail = [this, pos]() {
      _stream.revert(pos);
      return optional<Def>();
    };
    auto const s = _name();
    if (!s) return fail();
    space();
    if (!_sym(":")) return fail();
    auto names = vector<string>();
    auto const t = term(names);
    if (!t) return fail();
    space();
    auto const x = term(names);
    if (!x) return fail();
    return Def{*s, *t, *x};
  }

  auto parseTerm(string const& s, Allocator<Term>& pool, vector<string> names) -> optional<Term const*> {
    auto parser = Parser(s, pool);
    parser.space();
    auto const res = parser.term(names);
    parser.space();
    if (!res || !parser.eof()) return {};
    return res;
  }

  auto parseDef(string const& s, Allocator<Term>& pool) -> optional<Def> {
    auto parser = Parser(s, pool);
    parser.space();
    auto res = parser.def();
    parser.space();
    if (!res || !parser.eof()) return {};
    return res;
  }

  auto parseModule(string const& s) -> optional<Module> {
    auto pool = Allocator<Term>();
    auto parser = Parser(s, pool);
    auto res = Module();
    parser.space();
    while (!parser.eof()) {
      auto const d = parser.def();
      if (!d) return {};
      res.add(*d);
      parser.space();
    }
    return res;
  }

#include "macros_close.hpp"
}
