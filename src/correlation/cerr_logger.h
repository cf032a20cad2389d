#pragma once

// This component provides a class, `CerrLogger`, that implements the `Logger`
// interface from `logger.h`. `CerrLogger` writes one line per message to
// `std::cerr`, or to another stream given at construction. Each line begins
// with "[correlation error] " or "[correlation startup] ", according to the
// kind of message.
//
// `CerrLogger` is the default logger used by `Correlator` unless otherwise
// configured in `CorrelatorConfig`. Messages written concurrently from
// different threads are not interleaved.

#include <correlation/logger.h>

#include <iosfwd>
#include <mutex>

namespace correlation {
namespace tracing {

class CerrLogger : public Logger {
  std::mutex mutex_;
  std::ostream& destination_;

 public:
  CerrLogger();
  explicit CerrLogger(std::ostream& destination);

  void log_error(const LogFunc&) override;
  void log_startup(const LogFunc&) override;
  using Logger::log_error;

 private:
  void log(StringView label, const LogFunc&);
};

}  // namespace tracing
}  // namespace correlation
