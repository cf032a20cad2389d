#pragma once

// This component provides a class, `Correlator`, that connects the trace
// context headers of requests to `Traceparent` objects.
//
// `Correlator::extract` examines the headers of an inbound request and returns
// the `Traceparent` for the operation that handles the request, along with
// tags that describe how the headers were interpreted.
//
// `Correlator::inject` writes the headers of an outbound request made on
// behalf of an operation.
//
// Which headers are read and written is determined by the propagation styles
// in `FinalizedCorrelatorConfig`. See `correlator_config.h`.

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "correlator_config.h"
#include "dict_reader.h"
#include "dict_writer.h"
#include "propagation_style.h"
#include "traceparent.h"

namespace correlation {
namespace tracing {

class IDGenerator;
class Logger;

struct Correlation {
  Traceparent trace_context;
  // Tags to attach to the telemetry of the inbound request, e.g.
  // `tags::legacy_root_id`. See `tags.h`.
  std::unordered_map<std::string, std::string> tags;
};

class Correlator {
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<const IDGenerator> generator_;
  std::vector<PropagationStyle> extraction_styles_;
  std::vector<PropagationStyle> injection_styles_;

 public:
  explicit Correlator(const FinalizedCorrelatorConfig& config);

  // Return the trace context of an operation handling a request that has the
  // specified `headers`. This function never fails; if `headers` contain no
  // usable trace context, then a new trace is started.
  Correlation extract(const DictReader& headers) const;

  // Write the specified `context` into the specified `headers` in each of the
  // configured injection styles.
  void inject(const Traceparent& context, DictWriter& headers) const;

  // Return a JSON representation of this object's configuration.
  std::string config() const;
};

}  // namespace tracing
}  // namespace correlation
