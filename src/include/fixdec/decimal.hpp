#pragma once

#include <array>
#include <cassert>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace fixdec {

  struct parse_result;

  // Fixed-capacity decimal number.
  //
  // The value is stored as up to max_groups base-10^9 digit groups, most
  // significant first:
  //
  //   value = sum(digits[i] * 10^(9 * (weight - i)))
  //
  // scale is the number of fractional digits shown by to_string() and does
  // not take part in comparison. Zero is always ndigits == 0 with positive
  // sign, weight 0 and scale 0. Stored groups are trimmed, so neither the
  // first nor the last populated group is ever zero.
  class decimal {
  public:
    enum class sign_type : uint8_t { positive, negative, nan };

    static constexpr int group_digits = 9;
    static constexpr int max_groups = 5;
    static constexpr int max_precision = 36;
    static constexpr int max_exponent_digits = 3;

  private:
    sign_type sign_ = sign_type::positive;
    int16_t weight_ = 0;
    int16_t scale_ = 0;
    uint8_t ndigits_ = 0;
    std::array<uint32_t, max_groups> digits_{};

    // Fields must already be normalized; only the group count is checked.
    constexpr decimal(sign_type sign, int16_t weight, int16_t scale,
                      uint8_t ndigits,
                      const std::array<uint32_t, max_groups>& digits)
        : sign_(sign), weight_(weight), scale_(scale), ndigits_(ndigits),
          digits_(digits) {
      assert(ndigits <= max_groups);
    }

    std::strong_ordering
    compare_magnitude(const decimal& other) const;

    friend parse_result
    parse(std::string_view str);

  public:
    constexpr decimal() = default;
    explicit decimal(std::string_view str);

    static constexpr decimal
    zero() {
      return decimal();
    }

    static constexpr decimal
    nan() {
      return decimal(sign_type::nan, 0, 0, 0, {});
    }

    std::string
    to_string() const;

    bool
    is_zero() const {
      return ndigits_ == 0 && sign_ != sign_type::nan;
    }

    bool
    is_nan() const {
      return sign_ == sign_type::nan;
    }

    bool
    is_sign_positive() const {
      return sign_ == sign_type::positive;
    }

    bool
    is_sign_negative() const {
      return sign_ == sign_type::negative;
    }

    sign_type
    sign() const {
      return sign_;
    }

    int16_t
    weight() const {
      return weight_;
    }

    int16_t
    scale() const {
      return scale_;
    }

    std::span<const uint32_t>
    digits() const {
      return {digits_.data(), ndigits_};
    }

    // NaN equals NaN and sorts after every other value.
    std::strong_ordering
    operator<=>(const decimal& other) const;
    bool
    operator==(const decimal& other) const;

    friend std::ostream&
    operator<<(std::ostream& os, const decimal& d) {
      return os << d.to_string();
    }
  };

} // namespace fixdec

// Scale is display-only, so it is left out to stay consistent with ==.
template <>
struct std::hash<fixdec::decimal> {
  std::size_t
  operator()(const fixdec::decimal& d) const noexcept {
    std::size_t seed = std::hash<int>{}(static_cast<int>(d.sign()));
    seed ^= std::hash<int>{}(d.weight()) + 0x9e3779b9 + (seed << 6) +
            (seed >> 2);
    for (uint32_t group : d.digits()) {
      seed ^= std::hash<uint32_t>{}(group) + 0x9e3779b9 + (seed << 6) +
              (seed >> 2);
    }
    return seed;
  }
};
