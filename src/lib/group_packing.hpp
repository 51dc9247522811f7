#pragma once

#include <fixdec/decimal.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace fixdec::detail {

  inline constexpr int group_digits = decimal::group_digits;
  inline constexpr int max_groups = decimal::max_groups;

  // Integer division rounding toward negative infinity.
  constexpr int
  floor_div(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) { --q; }
    return q;
  }

  // Index of the base-10^9 group holding the decimal digit 10^dec_weight.
  constexpr int
  group_weight(int dec_weight) {
    return floor_div(dec_weight, group_digits);
  }

  // Zero digits to put in front of the most significant decimal digit so
  // that it lands at position dec_weight inside its group:
  //
  //   leading_pad = (group_weight + 1) * 9 - (dec_weight + 1)
  //
  // The result is always in [0, 8].
  constexpr int
  leading_pad(int dec_weight) {
    return (group_weight(dec_weight) + 1) * group_digits - (dec_weight + 1);
  }

  struct packed_groups {
    int weight = 0;
    uint8_t ndigits = 0;
    std::array<uint32_t, max_groups> groups{};
  };

  // Pack the ASCII digit runs integral and fractional, read as one run whose
  // first digit has decimal exponent dec_weight, into digit groups.
  //
  // Phase one lays the digits out in a scratch buffer with leading_pad()
  // zeros in front and enough zeros behind to complete the last group.
  // Phase two reads the buffer nine digits at a time. Zero groups at either
  // end are dropped; dropping a leading group lowers the weight so the
  // value is unchanged.
  //
  // The caller guarantees integral.size() + fractional.size() is at most
  // decimal::max_precision.
  inline packed_groups
  pack_groups(std::string_view integral, std::string_view fractional,
              int dec_weight) {
    static_assert(decimal::max_precision + group_digits - 1 <=
                  max_groups * group_digits);

    std::array<uint8_t, max_groups * group_digits> buffer{};
    int pad = leading_pad(dec_weight);
    std::size_t pos = static_cast<std::size_t>(pad);
    for (char c : integral) {
      buffer[pos++] = static_cast<uint8_t>(c - '0');
    }
    for (char c : fractional) {
      buffer[pos++] = static_cast<uint8_t>(c - '0');
    }
    // Trailing padding is already zero.
    int ngroups = (static_cast<int>(pos) + group_digits - 1) / group_digits;

    packed_groups result;
    result.weight = group_weight(dec_weight);
    for (int g = 0; g < ngroups; ++g) {
      uint32_t group = 0;
      for (int i = 0; i < group_digits; ++i) {
        group = group * 10 + buffer[g * group_digits + i];
      }
      result.groups[g] = group;
    }

    int first = 0;
    while (first < ngroups && result.groups[first] == 0) {
      ++first;
    }
    int last = ngroups;
    while (last > first && result.groups[last - 1] == 0) {
      --last;
    }

    if (first == last) { return packed_groups{}; }

    for (int g = first; g < last; ++g) {
      result.groups[g - first] = result.groups[g];
    }
    for (int g = last - first; g < max_groups; ++g) {
      result.groups[g] = 0;
    }
    result.weight -= first;
    result.ndigits = static_cast<uint8_t>(last - first);
    return result;
  }

} // namespace fixdec::detail
