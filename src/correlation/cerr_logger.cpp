#include "cerr_logger.h"

#include <iostream>
#include <sstream>

namespace correlation {
namespace tracing {

CerrLogger::CerrLogger() : destination_(std::cerr) {}

CerrLogger::CerrLogger(std::ostream& destination)
    : destination_(destination) {}

void CerrLogger::log_error(const LogFunc& write) {
  log("[correlation error] ", write);
}

void CerrLogger::log_startup(const LogFunc& write) {
  log("[correlation startup] ", write);
}

void CerrLogger::log(StringView label, const LogFunc& write) {
  // Format outside of the lock, then emit the whole line at once.
  std::ostringstream line;
  line << label;
  write(line);
  line << '\n';

  std::lock_guard<std::mutex> lock{mutex_};
  destination_ << line.str() << std::flush;
}

}  // namespace tracing
}  // namespace correlation
