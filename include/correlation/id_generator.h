#pragma once

// This component provides facilities for generating the IDs used as trace IDs
// and span IDs.
//
// `IDGenerator` is an interface whose `trace_id` produces 32 lowercase
// hexadecimal digits (128 bits) and whose `span_id` produces 16 lowercase
// hexadecimal digits (64 bits).
//
// `default_id_generator` returns an `IDGenerator` backed by the thread-local
// pseudo-random sequence in `random.h`. Its `span_id` is the first 16 digits
// of a newly generated trace ID.

#include <memory>
#include <string>

namespace correlation {
namespace tracing {

class IDGenerator {
 public:
  virtual ~IDGenerator() = default;

  virtual std::string trace_id() const = 0;
  virtual std::string span_id() const = 0;
};

std::shared_ptr<const IDGenerator> default_id_generator();

}  // namespace tracing
}  // namespace correlation
