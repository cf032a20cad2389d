#include <correlation/id_generator.h>

#include "hex.h"
#include "random.h"

namespace correlation {
namespace tracing {
namespace {

class DefaultIDGenerator : public IDGenerator {
 public:
  std::string trace_id() const override {
    std::string result = hex_padded(random_uint64());
    result += hex_padded(random_uint64());
    return result;
  }

  std::string span_id() const override { return trace_id().substr(0, 16); }
};

}  // namespace

std::shared_ptr<const IDGenerator> default_id_generator() {
  static const auto generator = std::make_shared<DefaultIDGenerator>();
  return generator;
}

}  // namespace tracing
}  // namespace correlation
