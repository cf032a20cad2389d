#pragma once

// This component provides an interface, `Logger`, that allows for the
// controlled output of diagnostic messages.
//
// `Logger` has two kinds of operations:
// - `log_error`, which is invoked when something unexpected happens, such as a
//   misconfigured environment variable.
// - `log_startup`, which is invoked once when a `Correlator` is constructed,
//   to describe its configuration.
//
// Both operations accept a `LogFunc`, which writes the message to a
// `std::ostream`. The message is formatted only if the logger actually emits
// it.

#include <functional>
#include <iosfwd>

#include "string_view.h"

namespace correlation {
namespace tracing {

struct Error;

class Logger {
 public:
  using LogFunc = std::function<void(std::ostream&)>;

  virtual ~Logger() {}

  virtual void log_error(const LogFunc&) = 0;
  virtual void log_startup(const LogFunc&) = 0;

  virtual void log_error(const Error&);
  virtual void log_error(StringView);
};

}  // namespace tracing
}  // namespace correlation
