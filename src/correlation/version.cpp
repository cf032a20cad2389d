#include <correlation/version.h>

namespace correlation {
namespace tracing {

const char* const correlation_version_string = "[correlation version v1.0.0]";

}  // namespace tracing
}  // namespace correlation
