#pragma once

// This component provides a function, `hex_padded`, for formatting an unsigned
// integral value in hexadecimal.

#include <cassert>
#include <charconv>
#include <iterator>
#include <limits>
#include <string>
#include <system_error>

namespace correlation {
namespace tracing {

// Return the specified `value` formatted as a lower-case hexadecimal string,
// zero-padded on the left to the full width of `Integer`, e.g. 16 characters
// for `std::uint64_t`.
template <typename Integer>
std::string hex_padded(Integer value) {
  constexpr int digits = std::numeric_limits<Integer>::digits / 4;
  char buffer[digits];

  const int base = 16;
  auto result =
      std::to_chars(std::begin(buffer), std::end(buffer), value, base);
  assert(result.ec == std::errc());

  const auto length = result.ptr - std::begin(buffer);
  std::string padded(digits - length, '0');
  padded.append(std::begin(buffer), result.ptr);
  return padded;
}

}  // namespace tracing
}  // namespace correlation
