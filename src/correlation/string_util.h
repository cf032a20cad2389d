#pragma once

// This component provides string manipulation miscellanea.

#include <string>
#include <vector>

#include <correlation/string_view.h>

namespace correlation {
namespace tracing {

// Return the specified `text` without leading and trailing whitespace.
StringView trim(StringView text);

// Return the pieces of the specified `text` that are separated by the
// specified `separator`. Empty pieces are kept, so the result always has one
// more element than there are occurrences of `separator` in `text`.
std::vector<StringView> split(StringView text, char separator);

// Convert the specified `text` to lower case in-place.
void to_lower(std::string& text);

}  // namespace tracing
}  // namespace correlation
