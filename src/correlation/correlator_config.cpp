#include <correlation/correlator_config.h>

#include <algorithm>
#include <cassert>
#include <string>
#include <utility>

#include "cerr_logger.h"
#include "environment.h"
#include "parse_util.h"

namespace correlation {
namespace tracing {
namespace {

using Styles = std::vector<PropagationStyle>;

const Styles default_styles{PropagationStyle::W3C,
                            PropagationStyle::REQUEST_ID};

std::string json_quoted(StringView text) {
  std::string unquoted;
  assign(unquoted, text);
  return nlohmann::json(std::move(unquoted)).dump();
}

// Return an error describing the last element of the specified `styles` if it
// also occurs earlier in `styles`, or return `nullopt` otherwise. The
// specified `source` is the text the styles came from, for use in the error
// message.
Optional<Error> last_is_duplicate(const Styles &styles, StringView source) {
  assert(!styles.empty());

  const auto dupe = std::find(styles.begin(), styles.end() - 1, styles.back());
  if (dupe == styles.end() - 1) {
    return nullopt;
  }

  std::string message;
  message += "The propagation style ";
  message += json_quoted(to_string_view(styles.back()));
  message += " is duplicated in: ";
  append(message, source);
  return Error{Error::DUPLICATE_PROPAGATION_STYLE, std::move(message)};
}

Expected<Styles> parse_propagation_styles(StringView input) {
  Styles styles;

  // Style names are separated by spaces, or a comma, or some combination.
  for (const StringView &item : parse_list(input)) {
    if (const auto style = parse_propagation_style(item)) {
      styles.push_back(*style);
    } else {
      std::string message;
      message += "Unsupported propagation style \"";
      append(message, item);
      message += "\" in list \"";
      append(message, input);
      message +=
          "\".  The following styles are supported: tracecontext, "
          "request-id, none.";
      return Error{Error::UNKNOWN_PROPAGATION_STYLE, std::move(message)};
    }

    if (auto maybe_error = last_is_duplicate(styles, input)) {
      return *maybe_error;
    }
  }

  return styles;
}

// Return the propagation styles parsed from the specified `env_var`. If
// `env_var` is not in the environment, return `nullopt`. If an error occurs,
// return an `Error`.
Expected<Optional<Styles>> styles_from_env(environment::Variable env_var) {
  const auto styles_env = environment::lookup(env_var);
  if (!styles_env) {
    return Optional<Styles>{};
  }

  auto styles = parse_propagation_styles(*styles_env);
  if (auto *error = styles.if_error()) {
    std::string prefix;
    prefix += "Unable to parse ";
    append(prefix, environment::name(env_var));
    prefix += " environment variable: ";
    return error->with_prefix(prefix);
  }
  return Optional<Styles>{std::move(*styles)};
}

// Return an error if the specified `styles`, which were configured in code,
// contain a duplicate.
Optional<Error> check_for_duplicates(const Optional<Styles> &styles,
                                     StringView description) {
  if (!styles) {
    return nullopt;
  }

  Styles seen;
  for (const auto style : *styles) {
    seen.push_back(style);
    if (auto error = last_is_duplicate(seen, description)) {
      return error;
    }
  }
  return nullopt;
}

Expected<CorrelatorConfig> load_env_config(Logger &logger) {
  CorrelatorConfig env_cfg;

  if (auto startup_env =
          environment::lookup(environment::CORRELATION_TRACE_STARTUP_LOGS)) {
    env_cfg.log_on_startup = !falsy(*startup_env);
  }

  // Print a warning if the general propagation style variable is defined
  // alongside a more specific one, which overrides it.
  const auto general = environment::CORRELATION_PROPAGATION_STYLE;
  const environment::Variable overrides[] = {
      environment::CORRELATION_PROPAGATION_STYLE_EXTRACT,
      environment::CORRELATION_PROPAGATION_STYLE_INJECT,
  };

  if (const auto general_value = environment::lookup(general)) {
    for (const auto var_override : overrides) {
      const auto value_override = environment::lookup(var_override);
      if (!value_override) {
        continue;
      }

      std::string message;
      message += "Both the environment variables ";
      append(message, environment::name(general));
      message += "=";
      message += json_quoted(*general_value);
      message += " and ";
      append(message, environment::name(var_override));
      message += "=";
      message += json_quoted(*value_override);
      message += " are defined. ";
      append(message, environment::name(var_override));
      message += " will take precedence.";

      logger.log_error(
          Error{Error::MULTIPLE_PROPAGATION_STYLE_ENVIRONMENT_VARIABLES,
                std::move(message)});
    }
  }

  auto global_styles = styles_from_env(general);
  if (auto *error = global_styles.if_error()) {
    return std::move(*error);
  }

  auto extraction_styles =
      styles_from_env(environment::CORRELATION_PROPAGATION_STYLE_EXTRACT);
  if (auto *error = extraction_styles.if_error()) {
    return std::move(*error);
  }
  env_cfg.extraction_styles =
      *extraction_styles ? *extraction_styles : *global_styles;

  auto injection_styles =
      styles_from_env(environment::CORRELATION_PROPAGATION_STYLE_INJECT);
  if (auto *error = injection_styles.if_error()) {
    return std::move(*error);
  }
  env_cfg.injection_styles =
      *injection_styles ? *injection_styles : *global_styles;

  return env_cfg;
}

// Return the first of the specified `from_env` and `from_user` that has a
// value, or the specified `fallback` if neither does. This function defines
// the relative precedence among configuration values originating from the
// environment, programmatic configuration, and default configuration.
template <typename Value>
Value pick(const Optional<Value> &from_env, const Optional<Value> &from_user,
           const Value &fallback) {
  if (from_env) {
    return *from_env;
  } else if (from_user) {
    return *from_user;
  }
  return fallback;
}

}  // namespace

Expected<FinalizedCorrelatorConfig> finalize_config(
    const CorrelatorConfig &user_config) {
  auto logger =
      user_config.logger ? user_config.logger : std::make_shared<CerrLogger>();

  if (auto error = check_for_duplicates(user_config.extraction_styles,
                                        "CorrelatorConfig::extraction_styles")) {
    return std::move(*error);
  }
  if (auto error = check_for_duplicates(user_config.injection_styles,
                                        "CorrelatorConfig::injection_styles")) {
    return std::move(*error);
  }

  auto env = load_env_config(*logger);
  if (auto *error = env.if_error()) {
    return std::move(*error);
  }

  FinalizedCorrelatorConfig final_config;
  final_config.logger = std::move(logger);
  final_config.id_generator = user_config.id_generator
                                  ? user_config.id_generator
                                  : default_id_generator();

  final_config.extraction_styles = pick(
      env->extraction_styles, user_config.extraction_styles, default_styles);
  if (final_config.extraction_styles.empty()) {
    return Error{Error::MISSING_EXTRACTION_STYLE,
                 "At least one extraction style must be specified."};
  }

  final_config.injection_styles = pick(
      env->injection_styles, user_config.injection_styles, default_styles);
  if (final_config.injection_styles.empty()) {
    return Error{Error::MISSING_INJECTION_STYLE,
                 "At least one injection style must be specified."};
  }

  final_config.log_on_startup =
      pick(env->log_on_startup, user_config.log_on_startup, true);

  return final_config;
}

}  // namespace tracing
}  // namespace correlation
