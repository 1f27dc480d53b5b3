#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <core/module.hpp>
#include <core/term.hpp>
#include <eval/evaluator.hpp>
#include <eval/normalizer.hpp>
#include <parsing/parser.hpp>

using std::string;
using std::cin, std::cout, std::cerr, std::endl;
using namespace selfcore;

// See: https://stackoverflow.com/questions/116038/how-do-i-read-an-entire-file-into-a-stdstring-in-c
auto readFile(string const& path) -> std::optional<string> {
  auto in = std::ifstream(path);
  if (!in) return {};
  std::ostringstream sstr;
  sstr << in.rdbuf();
  return sstr.str();
}

// Adds all definitions in `in` to `module`. Returns false if `in` is not a module.
auto load(core::Module& module, string const& in) -> bool {
  auto const res = parsing::parseModule(in);
  if (!res) return false;
  for (auto const& def: *res) module.add(def);
  return true;
}

auto main(int argc, char* argv[]) -> int {
  auto const args = std::span(argv, static_cast<size_t>(argc));
  auto module = core::Module();

  for (auto i = 1uz; i < args.size(); i++) {
    auto const in = readFile(args[i]);
    if (!in) cerr << "Could not read file: " << args[i] << endl;
    else if (!load(module, *in)) cerr << "Parsing error in file: " << args[i] << endl;
  }

  // Evaluates a single term with `f` and prints the result.
  auto const run = [&module](string const& in, auto f) {
    auto pool = Allocator<core::Term>();
    auto const t = parsing::parseTerm(in, pool);
    if (!t) {
      cerr << "Parsing error, expected a term" << endl;
      return;
    }
    cout << f(*t, pool)->toString() << endl;
  };

  auto in = string();
  while (true) {
    cout << ">> ";
    if (!std::getline(cin, in)) break;
    if (in.starts_with(":{")) { // Multi-line input
      in = in.substr(2) + "\n";
      string curr;
      while (std::getline(cin, curr) && curr != ":}") in += curr + "\n";
    } else if (in.starts_with(':')) {
      auto const pos = in.find(' ');
      auto const cmd = in.substr(1, pos == string::npos ? string::npos : pos - 1);
      auto const arg = pos == string::npos ? string() : in.substr(pos + 1);
      if (cmd == "quit") break;
      if (cmd == "load") {
        auto const content = readFile(arg);
        if (!content) cerr << "Could not read file: " << arg << endl;
        else if (!load(module, *content)) cerr << "Parsing error in file: " << arg << endl;
      } else if (cmd == "defs") {
        cout << module.toString() << endl;
      } else if (cmd == "eval") {
        run(arg, [&module](core::Term const* t, Allocator<core::Term>& pool) { return eval::evalTerm(t, module, pool); });
      } else if (cmd == "reduce") {
        run(arg, [&module](core::Term const* t, Allocator<core::Term>& pool) { return eval::reduce(module, t, pool); });
      } else if (cmd == "normalize") {
        run(arg, [&module](core::Term const* t, Allocator<core::Term>& pool) { return eval::normalize(module, t, pool); });
      } else if (cmd == "erase") {
        run(arg, [](core::Term const* t, Allocator<core::Term>& pool) { return t->erase(pool); });
      } else {
        cerr << "Unknown command: :" << cmd << endl;
      }
      continue;
    }
    // Definitions are added to the module; anything else is normalized
    if (load(module, in)) continue;
    run(in, [&module](core::Term const* t, Allocator<core::Term>& pool) { return eval::normalize(module, t, pool); });
  }

  return 0;
}
