#ifndef SELFCORE_CORE_MODULE_HPP
#define SELFCORE_CORE_MODULE_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <common.hpp>
#include "term.hpp"

namespace selfcore::core {
#include "macros_open.hpp"

  // A named definition. Terms are closed (free names are references to other definitions).
  struct Def {
    std::string name;
    Term const* type;
    Term const* term;

    // `name : type` on one line, the term on the next.
    auto toString() const -> std::string {
      return name + " : " + type->toString() + "\n" + term->toString();
    }
  };

  // A class is a "definition source" if it allows looking up definitions by name
  // (returns `nullptr` if the name is undefined).
  class Definitions {
    interface(Definitions);
  public:
    virtual auto lookup(std::string const& name) const -> Def const* required;
  };

  // Module: definitions stored in insertion order.
  // Invariant: all terms are stored in the allocator managed by this `Module`.
  class Module: public Definitions {
  public:
    Module() = default;
    Module(Module const&) = delete;
    Module(Module&&) = default;
    auto operator=(Module const&) -> Module& = delete;
    auto operator=(Module&&) -> Module& = default;
    ~Module() override = default;

    // Copies the terms of `def` into this module.
    // Redefining a name replaces the old definition, keeping its position.
    // Returns the position of the definition.
    auto add(Def const& def) -> size_t;

    auto lookup(std::string const& name) const -> Def const* override {
      if (auto const it = _indices.find(name); it != _indices.end())
        return &_entries[it->second];
      return nullptr;
    }

    auto size() const -> size_t {
      return _entries.size();
    }
    auto operator[](size_t index) const -> Def const& {
      return _entries.at(index);
    }
    auto begin() const {
      return _entries.begin();
    }
    auto end() const {
      return _entries.end();
    }

    // Persisted form: definitions separated by blank lines, in insertion order.
    auto toString() const -> std::string;

  private:
    Allocator<Term> _pool;
    std::vector<Def> _entries;
    std::unordered_map<std::string, size_t> _indices;
  };

#include "macros_close.hpp"
}

#endif // SELFCORE_CORE_MODULE_HPP
