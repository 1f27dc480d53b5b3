#ifndef SELFCORE_PARSING_BASIC_HPP
#define SELFCORE_PARSING_BASIC_HPP

#include <common.hpp>

namespace selfcore::parsing {
#include "macros_open.hpp"

  // Assuming 8-bit code units (UTF-8).
  using Char = uint8_t;

  // Character classes of the term syntax.
  constexpr auto isSpace(Char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }
  constexpr auto isNameChar(Char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  }

#include "macros_close.hpp"
}

#endif // SELFCORE_PARSING_BASIC_HPP
