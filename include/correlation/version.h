#pragma once

// This component provides the release version of this library.
// `correlation_version_string` is included in the configuration that a
// `Correlator` logs when it is created.

namespace correlation {
namespace tracing {

extern const char* const correlation_version_string;

}  // namespace tracing
}  // namespace correlation
