#include <fixdec/parse.hpp>

#include "group_packing.hpp"

#include <algorithm>

namespace fixdec {

  namespace {

    using sign_type = decimal::sign_type;

    // Sign, digit runs and exponent of a numeric literal.
    struct decimal_parts {
      sign_type sign = sign_type::positive;
      std::string_view integral;
      std::string_view fractional;
      int exponent = 0;
    };

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    // ASCII whitespace, without vertical tab.
    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
    }

    bool
    is_exponent_marker(std::string_view str) {
      return !str.empty() && (str[0] == 'e' || str[0] == 'E');
    }

    void
    eat_whitespace(std::string_view& str) {
      std::size_t n = 0;
      while (n < str.size() && is_space(str[n])) {
        ++n;
      }
      str.remove_prefix(n);
    }

    bool
    only_whitespace(std::string_view str) {
      return std::all_of(str.begin(), str.end(), is_space);
    }

    std::string_view
    eat_digits(std::string_view& str) {
      std::size_t n = 0;
      while (n < str.size() && is_digit(str[n])) {
        ++n;
      }
      std::string_view digits = str.substr(0, n);
      str.remove_prefix(n);
      return digits;
    }

    sign_type
    extract_sign(std::string_view& str) {
      if (!str.empty() && (str[0] == '+' || str[0] == '-')) {
        sign_type sign =
            str[0] == '-' ? sign_type::negative : sign_type::positive;
        str.remove_prefix(1);
        return sign;
      }
      return sign_type::positive;
    }

    bool
    extract_nan(std::string_view& str) {
      if (str.size() < 3) { return false; }
      for (std::size_t i = 0; i < 3; ++i) {
        char c = str[i];
        if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); }
        if (c != "nan"[i]) { return false; }
      }
      str.remove_prefix(3);
      return true;
    }

    // Reads "[+-] digits" following an exponent marker. The exponent of a
    // zero literal is consumed but ignored, whatever its length.
    std::optional<parse_errc>
    extract_exponent(std::string_view& str, bool decimal_is_zero,
                     int& exponent) {
      sign_type sign = extract_sign(str);
      std::string_view digits = eat_digits(str);

      if (digits.empty()) { return parse_errc::invalid; }

      if (decimal_is_zero) {
        exponent = 0;
        return std::nullopt;
      }

      while (!digits.empty() && digits[0] == '0') {
        digits.remove_prefix(1);
      }

      if (digits.size() >
          static_cast<std::size_t>(decimal::max_exponent_digits)) {
        return sign == sign_type::negative ? parse_errc::underflow
                                           : parse_errc::overflow;
      }

      int value = 0;
      for (char c : digits) {
        value = value * 10 + (c - '0');
      }
      exponent = sign == sign_type::negative ? -value : value;
      return std::nullopt;
    }

    // Splits a numeric literal into its parts, leaving anything after it in
    // str. Leading zeros of the integral run are dropped down to a single
    // '0'; trailing zeros of the fractional run are dropped.
    std::optional<parse_errc>
    split_decimal(std::string_view& str, decimal_parts& parts) {
      parts.sign = extract_sign(str);

      if (str.empty()) { return parse_errc::invalid; }

      parts.integral = eat_digits(str);
      while (parts.integral.size() > 1 && parts.integral[0] == '0') {
        parts.integral.remove_prefix(1);
      }

      if (is_exponent_marker(str)) {
        if (parts.integral.empty()) { return parse_errc::invalid; }
        str.remove_prefix(1);
        bool decimal_is_zero = parts.integral == "0";
        return extract_exponent(str, decimal_is_zero, parts.exponent);
      }

      if (!str.empty() && str[0] == '.') {
        str.remove_prefix(1);
        parts.fractional = eat_digits(str);
        if (parts.integral.empty() && parts.fractional.empty()) {
          return parse_errc::invalid;
        }
        while (!parts.fractional.empty() && parts.fractional.back() == '0') {
          parts.fractional.remove_suffix(1);
        }

        if (is_exponent_marker(str)) {
          str.remove_prefix(1);
          bool decimal_is_zero =
              (parts.integral.empty() || parts.integral == "0") &&
              parts.fractional.empty();
          return extract_exponent(str, decimal_is_zero, parts.exponent);
        }
        return std::nullopt;
      }

      if (parts.integral.empty()) { return parse_errc::invalid; }
      return std::nullopt;
    }

    parse_result
    failure(parse_errc code) {
      return {decimal(), code};
    }

  } // namespace

  parse_result
  parse(std::string_view str) {
    eat_whitespace(str);
    if (str.empty()) { return failure(parse_errc::empty); }

    if (extract_nan(str)) {
      if (!only_whitespace(str)) { return failure(parse_errc::invalid); }
      return {decimal::nan(), std::nullopt};
    }

    decimal_parts parts;
    if (auto err = split_decimal(str, parts)) { return failure(*err); }
    if (!only_whitespace(str)) { return failure(parse_errc::invalid); }

    bool lone_zero = parts.integral == "0";
    if ((parts.integral.empty() || lone_zero) && parts.fractional.empty()) {
      return {decimal::zero(), std::nullopt};
    }

    // A lone '0' counts toward the precision cap.
    if (parts.integral.size() + parts.fractional.size() >
        static_cast<std::size_t>(decimal::max_precision)) {
      return failure(parse_errc::overflow);
    }

    // Only nonzero integral digits position the most significant digit.
    std::string_view integral =
        lone_zero ? std::string_view() : parts.integral;

    int dec_weight = static_cast<int>(integral.size()) + parts.exponent - 1;
    int dec_scale =
        std::max(0, static_cast<int>(parts.fractional.size()) - parts.exponent);

    detail::packed_groups packed =
        detail::pack_groups(integral, parts.fractional, dec_weight);

    return {decimal(parts.sign, static_cast<int16_t>(packed.weight),
                    static_cast<int16_t>(dec_scale), packed.ndigits,
                    packed.groups),
            std::nullopt};
  }

} // namespace fixdec
