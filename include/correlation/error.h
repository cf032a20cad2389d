#pragma once

// This component provides a `struct`, `Error`, that is the error type used
// throughout this library. An `Error` has an integer `code` and a diagnostic
// `message`. `Error` is used as the alternative in `Expected<T>`; see
// `expected.h`.
//
// Only configuration produces errors. Parsing of inbound trace context never
// fails; see `traceparent.h`.

#include <iosfwd>
#include <string>

#include "string_view.h"

namespace correlation {
namespace tracing {

struct Error {
  enum Code {
    UNKNOWN_PROPAGATION_STYLE = 1,
    DUPLICATE_PROPAGATION_STYLE = 2,
    MISSING_EXTRACTION_STYLE = 3,
    MISSING_INJECTION_STYLE = 4,
    MULTIPLE_PROPAGATION_STYLE_ENVIRONMENT_VARIABLES = 5,
  };

  Code code;
  std::string message;

  Error with_prefix(StringView) const;
};

std::ostream& operator<<(std::ostream&, const Error&);

}  // namespace tracing
}  // namespace correlation
