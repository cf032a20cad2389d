#pragma once

// This component provides a function for examining legacy hierarchical
// request IDs, e.g. "|4bf92f3577b34da6a3ce929d0e0e4736.00f067aa0ba902b7.".
//
// A hierarchical request ID consists of a root segment, which identifies the
// whole operation, followed by dot-terminated segments identifying the calls
// made within it. The leading "|" is optional.

#include <string>

#include "string_view.h"

namespace correlation {
namespace tracing {

// Return the root segment of the specified hierarchical `request_id`: the text
// after an optional leading "|" and before the first ".". If `request_id`
// contains no ".", the root extends to the end of `request_id`.
std::string request_id_root(StringView request_id);

}  // namespace tracing
}  // namespace correlation
