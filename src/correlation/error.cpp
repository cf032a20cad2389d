#include <correlation/error.h>

#include <ostream>

namespace correlation {
namespace tracing {

std::ostream& operator<<(std::ostream& stream, const Error& error) {
  return stream << "[correlation error code " << int(error.code) << "] "
                << error.message;
}

Error Error::with_prefix(StringView prefix) const {
  Error result{code, ""};
  append(result.message, prefix);
  result.message += message;
  return result;
}

}  // namespace tracing
}  // namespace correlation
