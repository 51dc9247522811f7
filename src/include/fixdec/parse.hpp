#pragma once

#include <fixdec/decimal.hpp>
#include <fixdec/parse_error.hpp>

#include <optional>
#include <string_view>

namespace fixdec {

  struct parse_result {
    decimal value;
    std::optional<parse_errc> error;

    explicit
    operator bool() const {
      return !error.has_value();
    }
  };

  // Parse decimal text without throwing or allocating.
  //
  // Accepted forms, surrounded by optional ASCII whitespace:
  //
  //   nan                             (any letter case)
  //   [+-] digits [. [digits]] [(e|E) [+-] digits]
  //   [+-] . digits [(e|E) [+-] digits]
  //
  // On failure value is zero and error names the first violation found.
  parse_result
  parse(std::string_view str);

} // namespace fixdec
