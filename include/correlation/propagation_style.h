#pragma once

// This component provides an `enum class`, `PropagationStyle`, that indicates
// a trace context extraction or injection format. `CorrelatorConfig` has a
// list of styles for extraction and another for injection. See
// `correlator_config.h`.

#include "optional.h"
#include "string_view.h"

namespace correlation {
namespace tracing {

enum class PropagationStyle {
  // W3C trace context, i.e. the "traceparent" header.
  W3C,
  // Legacy hierarchical request IDs, i.e. the "request-id" header.
  REQUEST_ID,
  // The absence of propagation. If this is the only style set, then
  // propagation is disabled in the relevant direction (extraction or
  // injection).
  NONE,
};

// Return the configuration name of the specified `style`: "tracecontext",
// "request-id", or "none".
StringView to_string_view(PropagationStyle style);

// Return the style whose configuration name is, ignoring case, the specified
// `text`, or return `nullopt` if there is no such style.
Optional<PropagationStyle> parse_propagation_style(StringView text);

}  // namespace tracing
}  // namespace correlation
