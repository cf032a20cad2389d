#include <correlation/error.h>
#include <correlation/logger.h>

#include <ostream>

namespace correlation {
namespace tracing {

void Logger::log_error(const Error& error) {
  log_error([&](std::ostream& log) { log << error; });
}

void Logger::log_error(StringView message) {
  log_error([&](std::ostream& log) { log << message; });
}

}  // namespace tracing
}  // namespace correlation
