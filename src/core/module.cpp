#include "module.hpp"

using std::string;

namespace selfcore::core {
#include "macros_open.hpp"

  auto Module::add(Def const& def) -> size_t {
    auto entry = Def{def.name, def.type->clone(_pool), def.term->clone(_pool)};
    if (auto const it = _indices.find(def.name); it != _indices.end()) {
      _entries[it->second] = std::move(entry);
      return it->second;
    }
    _entries.push_back(std::move(entry));
    _indices[def.name] = _entries.size() - 1;
    return _entries.size() - 1;
  }

  auto Module::toString() const -> string {
    auto res = string();
    for (auto i = 0uz; i < _entries.size(); i++) {
      if (i > 0) res += "\n\n";
      res += _entries[i].toString();
    }
    return res;
  }

#include "macros_close.hpp"
}
