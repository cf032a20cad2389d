#pragma once

// This component provides the `StringView` alias used throughout this library,
// along with helpers for appending and assigning a `StringView` to a
// `std::string`.

#include <string>
#include <string_view>

namespace correlation {
namespace tracing {

using StringView = std::string_view;

inline void append(std::string& destination, StringView text) {
  destination.append(text.data(), text.size());
}

inline void assign(std::string& destination, StringView text) {
  destination.assign(text.data(), text.size());
}

}  // namespace tracing
}  // namespace correlation
