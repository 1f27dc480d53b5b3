#ifndef SELFCORE_PARSING_STREAM_HPP
#define SELFCORE_PARSING_STREAM_HPP

#include <optional>
#include <string>
#include <string_view>
#include "basic.hpp"

namespace selfcore::parsing {
#include "macros_open.hpp"

  // A class is a (finite) "revertable stream" of `T` if...
  template <typename T>
  class IStream {
    interface(IStream);
  public:
    // It allows generating the next element (or empty if reached the end):
    virtual auto advance() -> std::optional<T> required;
    // It allows obtaining the current position:
    virtual auto position() const -> size_t required;
    // It allows reverting to a previous position (i.e. `0 <= i <= position()`):
    virtual auto revert(size_t i) -> void required;
  };

  // A class is a "character stream" if it is a "revertable stream" of `Char`, and...
  class ICharStream: public IStream<Char> {
    interface(ICharStream);
  public:
    // It allows looking at the next character without consuming it:
    virtual auto peek() const -> std::optional<Char> required;
    // It allows for obtaining a view of the whole string:
    virtual auto string() const -> std::string_view required;
    // It allows for obtaining a view of some substring:
    virtual auto slice(size_t start, size_t end) const -> std::string_view required;
  };

  // Simplest implementation of `ICharStream` (wrapper around a `std::string`).
  class CharStream: public ICharStream {
  public:
    explicit CharStream(std::string string):
        _string(std::move(string)) {}

    auto advance() -> std::optional<Char> override {
      if (_position >= _string.size())
        return {};
      return static_cast<Char>(_string[_position++]);
    }
    auto position() const -> size_t override {
      return _position;
    }
    auto revert(size_t i) -> void override {
      assert(i <= _position), _position = i;
    }

    auto peek() const -> std::optional<Char> override {
      if (_position >= _string.size())
        return {};
      return static_cast<Char>(_string[_position]);
    }
    auto string() const -> std::string_view override {
      return _string;
    }
    auto slice(size_t start, size_t end) const -> std::string_view override {
      assert(start <= end && end <= _position);
      return std::string_view(_string).substr(start, end - start);
    }

  private:
    std::string _string;  // Underlying string.
    size_t _position = 0; // Current position.
  };

#include "macros_close.hpp"
}

#endif // SELFCORE_PARSING_STREAM_HPP
