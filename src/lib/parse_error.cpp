#include <fixdec/parse_error.hpp>

#include <string>

namespace fixdec {

  std::string_view
  message(parse_errc code) {
    switch (code) {
      case parse_errc::empty:
        return "cannot parse number from empty string";
      case parse_errc::invalid:
        return "invalid number";
      case parse_errc::overflow:
        return "numeric overflow";
      case parse_errc::underflow:
        return "numeric underflow";
    }
    return "unknown parse error";
  }

  std::ostream&
  operator<<(std::ostream& os, parse_errc code) {
    return os << message(code);
  }

  parse_error::parse_error(parse_errc code, std::string_view input)
      : std::invalid_argument("decimal: " + std::string(message(code)) +
                              " in '" + std::string(input) + "'"),
        code_(code) {}

} // namespace fixdec
