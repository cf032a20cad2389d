#pragma once

// This component provides the names of the tags (custom dimensions) that
// `Correlator::extract` attaches to the telemetry of an inbound request.

#include <string>

namespace correlation {
namespace tracing {
namespace tags {

// The root of an inbound "request-id" header that could not be used as a
// trace ID.
extern const std::string legacy_root_id;

namespace internal {
extern const std::string w3c_extraction_error;
}  // namespace internal

}  // namespace tags
}  // namespace tracing
}  // namespace correlation
