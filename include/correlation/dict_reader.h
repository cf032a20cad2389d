#pragma once

// This component provides an interface, `DictReader`, that represents a
// read-only key/value mapping of strings.  It's used when extracting trace
// context from the headers of an inbound request.

#include "optional.h"
#include "string_view.h"

namespace correlation {
namespace tracing {

class DictReader {
 public:
  virtual ~DictReader() {}

  // Return the value at the specified `key`, or return `nullopt` if there
  // is no value at `key`.
  virtual Optional<StringView> lookup(StringView key) const = 0;
};

}  // namespace tracing
}  // namespace correlation
