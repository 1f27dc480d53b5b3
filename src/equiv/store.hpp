#ifndef SELFCORE_EQUIV_STORE_HPP
#define SELFCORE_EQUIV_STORE_HPP

#include <utility>
#include <variant>
#include <common.hpp>
#include "parray.hpp"

namespace selfcore::equiv {
#include "macros_open.hpp"

  // Persistent disjoint-set structure over integer handles, each class carrying a descriptor of type `T`.
  // Handles are allocated sequentially from 0 by `fresh` and never reused.
  // Every update returns a new store; the old one remains valid.
  // Invariant: links form a forest, and every allocated handle resolves to exactly one root.
  // `find` does not compress paths, so it costs O(chain length * log size).
  template <typename T>
  class EquivalenceStore {
  public:
    // Result of `find`.
    struct Class {
      size_t id;
      uint64_t rank;
      T descriptor;
    };

    EquivalenceStore() = default;

    auto size() const -> size_t {
      return _entries.size();
    }

    // Allocates the next handle as a singleton class of rank 0.
    auto fresh(T descriptor) const -> std::pair<EquivalenceStore, size_t> {
      auto const id = _entries.size();
      return {EquivalenceStore(_entries.push(Root{0, std::move(descriptor)})), id};
    }

    // Follows links to the representative.
    // Throws `std::out_of_range` if `handle` is not allocated.
    auto find(size_t handle) const -> Class {
      auto i = handle;
      while (true) {
        auto const& entry = _entries.at(i);
        if (auto const root = std::get_if<Root>(&entry))
          return {i, root->rank, root->descriptor};
        i = std::get<Link>(entry).parent;
      }
    }

    // Merges by rank: the lower-rank representative is linked under the higher-rank one.
    // On equal ranks, `p1`'s representative is linked under `p2`'s, which gets rank + 1 and keeps
    // the descriptor of `p2`'s representative.
    auto unite(size_t p1, size_t p2) const -> EquivalenceStore {
      auto const c1 = find(p1);
      auto const c2 = find(p2);
      if (c1.id == c2.id)
        return *this;
      if (c1.rank < c2.rank)
        return EquivalenceStore(_entries.set(c1.id, Link{c2.id}));
      if (c1.rank > c2.rank)
        return EquivalenceStore(_entries.set(c2.id, Link{c1.id}));
      auto const linked = _entries.set(c1.id, Link{c2.id});
      return EquivalenceStore(linked.set(c2.id, Root{c2.rank + 1, c2.descriptor}));
    }

    auto descriptor(size_t handle) const -> T {
      return find(handle).descriptor;
    }

    auto equivalent(size_t p1, size_t p2) const -> bool {
      return find(p1).id == find(p2).id;
    }

  private:
    struct Root {
      uint64_t rank = 0;
      T descriptor{};
    };
    struct Link {
      size_t parent;
    };
    using Entry = std::variant<Root, Link>;

    PersistentArray<Entry> _entries;

    explicit EquivalenceStore(PersistentArray<Entry> entries):
        _entries(std::move(entries)) {}
  };

#include "macros_close.hpp"
}

#endif // SELFCORE_EQUIV_STORE_HPP
