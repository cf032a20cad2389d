#pragma once

// This component provides a registry of all environment variables that can be
// used to configure this library.
//
// Each `enum Variable` denotes an environment variable. The enum value names
// are the same as the names of the environment variables.
//
// `name` returns the name of a specified `Variable`.
//
// `lookup` retrieves the value of `Variable` in the environment.

#include <correlation/optional.h>
#include <correlation/string_view.h>

#include <nlohmann/json.hpp>

namespace correlation {
namespace tracing {
namespace environment {

// Keep this sorted.  The values must correspond to offsets within
// `variable_names`.
enum Variable {
  CORRELATION_PROPAGATION_STYLE,
  CORRELATION_PROPAGATION_STYLE_EXTRACT,
  CORRELATION_PROPAGATION_STYLE_INJECT,
  CORRELATION_TRACE_STARTUP_LOGS,
};

// Keep this sorted.  Offsets into this array are indicated by `Variable`
// values.
inline const char *const variable_names[] = {
    "CORRELATION_PROPAGATION_STYLE",
    "CORRELATION_PROPAGATION_STYLE_EXTRACT",
    "CORRELATION_PROPAGATION_STYLE_INJECT",
    "CORRELATION_TRACE_STARTUP_LOGS",
};

// Return the name of the specified environment `variable`.
StringView name(Variable variable);

// Return the value of the specified environment `variable`, or return
// `nullopt` if that variable is not set in the environment.
Optional<StringView> lookup(Variable variable);

// Return a JSON object whose keys are the names of the environment variables
// above that are set, and whose values are their values.
nlohmann::json to_json();

}  // namespace environment
}  // namespace tracing
}  // namespace correlation
