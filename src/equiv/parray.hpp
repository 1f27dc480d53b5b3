#ifndef SELFCORE_EQUIV_PARRAY_HPP
#define SELFCORE_EQUIV_PARRAY_HPP

#include <array>
#include <memory>
#include <stdexcept>
#include <common.hpp>

namespace selfcore::equiv {
#include "macros_open.hpp"

  // Persistent array: a trie of `2^Bits`-way nodes, updated by path copying.
  // Every "modifier" returns a new array; old arrays stay valid and share all untouched nodes.
  // `T` must be default-constructible and copyable.
  // O(log size) for all operations.
  template <typename T, size_t Bits = 4>
  class PersistentArray {
  public:
    static constexpr size_t branch = 1uz << Bits;
    static constexpr size_t mask = branch - 1;

    PersistentArray() = default;

    auto size() const -> size_t {
      return _size;
    }

    // Throws `std::out_of_range` if `i >= size()`.
    auto at(size_t i) const -> T const& {
      if (i >= _size)
        throw std::out_of_range("persistent array index out of range");
      auto node = _root.get();
      for (auto level = _height; level > 0; level--)
        node = node->children[(i >> (level * Bits)) & mask].get();
      return node->values[i & mask];
    }

    // Throws `std::out_of_range` if `i >= size()`.
    auto set(size_t i, T const& v) const -> PersistentArray {
      if (i >= _size)
        throw std::out_of_range("persistent array index out of range");
      return PersistentArray(_size, _height, _set(_root, _height, i, v));
    }

    auto push(T const& v) const -> PersistentArray {
      auto root = _root;
      auto height = _height;
      if (!root) {
        root = std::make_shared<Node>();
      } else if (_size == _capacity(height)) {
        // Full: add a level on top, with the old root as its leftmost child
        auto const top = std::make_shared<Node>();
        top->children[0] = root;
        root = top;
        height++;
      }
      return PersistentArray(_size + 1, height, _set(root, height, _size, v));
    }

  private:
    // Leaves (level 0) use `values`; inner nodes use `children`.
    struct Node {
      std::array<std::shared_ptr<Node const>, branch> children{};
      std::array<T, branch> values{};
    };

    size_t _size = 0;
    size_t _height = 0;
    std::shared_ptr<Node const> _root;

    PersistentArray(size_t size, size_t height, std::shared_ptr<Node const> root):
        _size(size),
        _height(height),
        _root(std::move(root)) {}

    static auto _capacity(size_t height) -> size_t {
      return 1uz << ((height + 1) * Bits);
    }

    static auto _set(std::shared_ptr<Node const> const& node, size_t level, size_t i, T const& v)
      -> std::shared_ptr<Node const> {
      auto const res = node ? std::make_shared<Node>(*node) : std::make_shared<Node>();
      if (level == 0) {
        res->values[i & mask] = v;
      } else {
        auto const k = (i >> (level * Bits)) & mask;
        res->children[k] = _set(res->children[k], level - 1, i, v);
      }
      return res;
    }
  };

#include "macros_close.hpp"
}

#endif // SELFCORE_EQUIV_PARRAY_HPP
