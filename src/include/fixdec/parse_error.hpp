#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace fixdec {

  enum class parse_errc : uint8_t {
    empty,     // nothing but whitespace
    invalid,   // malformed text
    overflow,  // too many digits or exponent too large
    underflow, // negative exponent too large in magnitude
  };

  std::string_view
  message(parse_errc code);

  std::ostream&
  operator<<(std::ostream& os, parse_errc code);

  class parse_error : public std::invalid_argument {
    parse_errc code_;

  public:
    parse_error(parse_errc code, std::string_view input);

    parse_errc
    code() const {
      return code_;
    }
  };

} // namespace fixdec
