#include <correlation/propagation_style.h>

#include <string>

#include "string_util.h"

namespace correlation {
namespace tracing {

StringView to_string_view(PropagationStyle style) {
  switch (style) {
    case PropagationStyle::W3C:
      return "tracecontext";
    case PropagationStyle::REQUEST_ID:
      return "request-id";
    case PropagationStyle::NONE:
      break;
  }
  return "none";
}

Optional<PropagationStyle> parse_propagation_style(StringView text) {
  auto token = std::string{text};
  to_lower(token);

  if (token == "tracecontext") {
    return PropagationStyle::W3C;
  } else if (token == "request-id") {
    return PropagationStyle::REQUEST_ID;
  } else if (token == "none") {
    return PropagationStyle::NONE;
  }

  return nullopt;
}

}  // namespace tracing
}  // namespace correlation
