#include <correlation/request_id.h>

namespace correlation {
namespace tracing {

std::string request_id_root(StringView request_id) {
  const std::size_t begin =
      !request_id.empty() && request_id.front() == '|' ? 1 : 0;
  std::size_t end = request_id.find('.');
  if (end == StringView::npos) {
    end = request_id.size();
  }
  return std::string{request_id.substr(begin, end - begin)};
}

}  // namespace tracing
}  // namespace correlation
