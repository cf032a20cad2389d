#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace correlation {
namespace tracing {
namespace {

constexpr StringView k_spaces_characters = " \f\n\r\t\v";

}  // namespace

StringView trim(StringView text) {
  text.remove_prefix(
      std::min(text.find_first_not_of(k_spaces_characters), text.size()));
  const auto pos = text.find_last_not_of(k_spaces_characters);
  if (pos != text.npos) text.remove_suffix(text.size() - pos - 1);
  return text;
}

std::vector<StringView> split(StringView text, char separator) {
  std::vector<StringView> pieces;
  std::size_t begin = 0;
  for (;;) {
    const std::size_t end = text.find(separator, begin);
    if (end == StringView::npos) {
      pieces.push_back(text.substr(begin));
      return pieces;
    }
    pieces.push_back(text.substr(begin, end - begin));
    begin = end + 1;
  }
}

void to_lower(std::string& text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
}

}  // namespace tracing
}  // namespace correlation
