#include <fixdec/decimal.hpp>

#include <fixdec/parse.hpp>

#include <cstdio>

namespace fixdec {

  namespace {

    // Powers of ten used to cut the last fractional group short.
    constexpr uint32_t powers_of_ten[] = {1,         10,        100,
                                          1000,      10000,     100000,
                                          1000000,   10000000,  100000000,
                                          1000000000};

    void
    append_group(std::string& out, uint32_t group, int width) {
      char buf[16];
      int n = width > 0
                  ? std::snprintf(buf, sizeof(buf), "%0*u", width, group)
                  : std::snprintf(buf, sizeof(buf), "%u", group);
      out.append(buf, static_cast<std::size_t>(n));
    }

  } // namespace

  decimal::decimal(std::string_view str) {
    auto result = parse(str);
    if (result.error) { throw parse_error(*result.error, str); }
    *this = result.value;
  }

  std::string
  decimal::to_string() const {
    if (is_nan()) { return "NaN"; }
    if (ndigits_ == 0) { return "0"; }

    std::string result;
    if (sign_ == sign_type::negative) { result += '-'; }

    auto group_at = [this](int d) -> uint32_t {
      return d >= 0 && d < ndigits_ ? digits_[d] : 0;
    };

    // Integral part: groups 0 through weight, first one unpadded.
    if (weight_ < 0) {
      result += '0';
    } else {
      for (int d = 0; d <= weight_; ++d) {
        append_group(result, group_at(d), d > 0 ? group_digits : 0);
      }
    }

    // Fractional part: exactly scale digits, the last group truncated.
    if (scale_ > 0) {
      result += '.';
      int d = weight_ + 1;
      for (int done = 0; done < scale_; done += group_digits, ++d) {
        uint32_t group = group_at(d);
        int width = scale_ - done;
        if (width >= group_digits) {
          append_group(result, group, group_digits);
        } else {
          append_group(result, group / powers_of_ten[group_digits - width],
                       width);
        }
      }
    }

    return result;
  }

  // Walks both group sequences from the most significant end. Groups that
  // only one side has above the other's weight are checked first; then the
  // aligned groups; then whatever is left over on either side.
  std::strong_ordering
  decimal::compare_magnitude(const decimal& other) const {
    int n1 = ndigits_;
    int n2 = other.ndigits_;
    int w1 = weight_;
    int w2 = other.weight_;
    int i1 = 0;
    int i2 = 0;

    while (w1 > w2 && i1 < n1) {
      if (digits_[i1] != 0) { return std::strong_ordering::greater; }
      ++i1;
      --w1;
    }
    while (w2 > w1 && i2 < n2) {
      if (other.digits_[i2] != 0) { return std::strong_ordering::less; }
      ++i2;
      --w2;
    }

    if (w1 == w2) {
      while (i1 < n1 && i2 < n2) {
        if (digits_[i1] != other.digits_[i2]) {
          return digits_[i1] <=> other.digits_[i2];
        }
        ++i1;
        ++i2;
      }
    }

    while (i1 < n1) {
      if (digits_[i1] != 0) { return std::strong_ordering::greater; }
      ++i1;
    }
    while (i2 < n2) {
      if (other.digits_[i2] != 0) { return std::strong_ordering::less; }
      ++i2;
    }

    return std::strong_ordering::equal;
  }

  std::strong_ordering
  decimal::operator<=>(const decimal& other) const {
    if (is_nan() || other.is_nan()) { return is_nan() <=> other.is_nan(); }

    if (is_zero()) {
      if (other.is_zero()) { return std::strong_ordering::equal; }
      return other.is_sign_negative() ? std::strong_ordering::greater
                                      : std::strong_ordering::less;
    }
    if (other.is_zero()) {
      return is_sign_positive() ? std::strong_ordering::greater
                                : std::strong_ordering::less;
    }

    if (is_sign_positive()) {
      if (other.is_sign_negative()) { return std::strong_ordering::greater; }
      return compare_magnitude(other);
    }
    if (other.is_sign_positive()) { return std::strong_ordering::less; }
    return other.compare_magnitude(*this);
  }

  bool
  decimal::operator==(const decimal& other) const {
    return (*this <=> other) == std::strong_ordering::equal;
  }

} // namespace fixdec
