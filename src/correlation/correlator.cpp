#include <correlation/correlator.h>
#include <correlation/logger.h>
#include <correlation/tags.h>
#include <correlation/version.h>

#include <nlohmann/json.hpp>

#include "environment.h"

namespace correlation {
namespace tracing {
namespace {

constexpr StringView traceparent_header = "traceparent";
constexpr StringView request_id_header = "request-id";

// Return the value of the specified `header` if it is present and not empty.
Optional<StringView> nonempty_header(const DictReader& headers,
                                     StringView header) {
  auto found = headers.lookup(header);
  if (found && found->empty()) {
    return nullopt;
  }
  return found;
}

}  // namespace

void to_json(nlohmann::json& j, const PropagationStyle& style) {
  j = std::string{to_string_view(style)};
}

Correlator::Correlator(const FinalizedCorrelatorConfig& config)
    : logger_(config.logger),
      generator_(config.id_generator),
      extraction_styles_(config.extraction_styles),
      injection_styles_(config.injection_styles) {
  if (config.log_on_startup) {
    logger_->log_startup([configuration = this->config()](std::ostream& log) {
      log << "CORRELATION CONFIGURATION - " << configuration;
    });
  }
}

Correlation Correlator::extract(const DictReader& headers) const {
  Optional<StringView> traceparent;
  Optional<StringView> request_id;

  for (const auto style : extraction_styles_) {
    if (style == PropagationStyle::W3C) {
      traceparent = nonempty_header(headers, traceparent_header);
      if (traceparent) break;
    } else if (style == PropagationStyle::REQUEST_ID) {
      request_id = nonempty_header(headers, request_id_header);
      if (request_id) break;
    }
  }

  Correlation result{Traceparent(traceparent, request_id, generator_), {}};

  const Traceparent& context = result.trace_context;
  if (const auto& root = context.legacy_root_id()) {
    result.tags[tags::legacy_root_id] = *root;
  }
  if (const auto& error = context.extraction_error()) {
    result.tags[tags::internal::w3c_extraction_error] = *error;
  }

  return result;
}

void Correlator::inject(const Traceparent& context, DictWriter& headers) const {
  for (const auto style : injection_styles_) {
    switch (style) {
      case PropagationStyle::W3C:
        headers.set(traceparent_header, context.serialize());
        break;
      case PropagationStyle::REQUEST_ID:
        headers.set(request_id_header, context.back_compat_id());
        break;
      case PropagationStyle::NONE:
        break;
    }
  }
}

std::string Correlator::config() const {
  // clang-format off
  auto config = nlohmann::json::object({
    {"version", correlation_version_string},
    {"extraction_styles", extraction_styles_},
    {"injection_styles", injection_styles_},
    {"environment_variables", environment::to_json()},
  });
  // clang-format on

  return config.dump();
}

}  // namespace tracing
}  // namespace correlation
