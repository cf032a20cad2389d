#pragma once

// This component provides a `struct`, `CorrelatorConfig`, used to configure a
// `Correlator`. `Correlator` is instantiated with a
// `FinalizedCorrelatorConfig`, which must be obtained from the result of a
// call to `finalize_config`.
//
// Each member of `CorrelatorConfig` that is left unset takes its default
// value. Some members can be overridden by environment variables, which take
// precedence over values set in code:
//
// - `extraction_styles`: `CORRELATION_PROPAGATION_STYLE_EXTRACT`, or else
//   `CORRELATION_PROPAGATION_STYLE`;
// - `injection_styles`: `CORRELATION_PROPAGATION_STYLE_INJECT`, or else
//   `CORRELATION_PROPAGATION_STYLE`;
// - `log_on_startup`: `CORRELATION_TRACE_STARTUP_LOGS`.

#include <memory>
#include <vector>

#include "expected.h"
#include "id_generator.h"
#include "logger.h"
#include "optional.h"
#include "propagation_style.h"

namespace correlation {
namespace tracing {

struct CorrelatorConfig {
  // Formats tried, in order, when extracting trace context from the headers
  // of an inbound request. The first format whose header is present wins.
  // The default is tracecontext followed by request-id.
  Optional<std::vector<PropagationStyle>> extraction_styles;

  // Formats written when injecting trace context into the headers of an
  // outbound request. The default is tracecontext and request-id.
  Optional<std::vector<PropagationStyle>> injection_styles;

  // Whether the configuration is logged when a `Correlator` is created. The
  // default is `true`.
  Optional<bool> log_on_startup;

  // Where diagnostics go. The default logs to `std::cerr`.
  std::shared_ptr<Logger> logger;

  // Source of new trace IDs and span IDs. The default is
  // `default_id_generator()`.
  std::shared_ptr<const IDGenerator> id_generator;
};

class FinalizedCorrelatorConfig {
  friend Expected<FinalizedCorrelatorConfig> finalize_config(
      const CorrelatorConfig& config);
  FinalizedCorrelatorConfig() = default;

 public:
  std::vector<PropagationStyle> extraction_styles;
  std::vector<PropagationStyle> injection_styles;
  bool log_on_startup;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<const IDGenerator> id_generator;
};

// Return a `FinalizedCorrelatorConfig` from the specified `config` and from
// any relevant environment variables. If any configuration is invalid, return
// an `Error`.
Expected<FinalizedCorrelatorConfig> finalize_config(
    const CorrelatorConfig& config);

}  // namespace tracing
}  // namespace correlation
