#include <correlation/tags.h>

namespace correlation {
namespace tracing {
namespace tags {

const std::string legacy_root_id = "ai_legacyRootID";

namespace internal {
const std::string w3c_extraction_error = "_correlation.w3c_extraction_error";
}  // namespace internal

}  // namespace tags
}  // namespace tracing
}  // namespace correlation
