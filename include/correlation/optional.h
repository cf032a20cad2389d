#pragma once

// This component provides the `Optional` alias used throughout this library,
// along with `nullopt`.

#include <optional>

namespace correlation {
namespace tracing {

template <typename Value>
using Optional = std::optional<Value>;

using std::nullopt;

}  // namespace tracing
}  // namespace correlation
