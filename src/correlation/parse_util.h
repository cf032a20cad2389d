#pragma once

// This component provides parsing-related miscellanea used by configuration.

#include <vector>

#include <correlation/string_view.h>

namespace correlation {
namespace tracing {

// Return the items of the specified `input`. List items are separated by an
// optional comma (",") and any amount of whitespace. Leading and trailing
// whitespace are ignored.
std::vector<StringView> parse_list(StringView input);

// Return whether the specified `text` is, ignoring case, one of "0", "false",
// or "no".
bool falsy(StringView text);

}  // namespace tracing
}  // namespace correlation
