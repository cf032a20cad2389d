#pragma once

// This component provides a class template, `Expected<T>`, that holds either
// the result of a configuration step, of type `T`, or the `Error` that
// prevented it.
//
// `finalize_config` in `correlator_config.h` returns an
// `Expected<FinalizedCorrelatorConfig>`. The idiom is:
//
//     auto finalized = finalize_config(config);
//     if (const auto* error = finalized.if_error()) {
//       // report `*error`
//     }
//     Correlator correlator{*finalized};

#include <utility>
#include <variant>

#include "error.h"

namespace correlation {
namespace tracing {

template <typename Value>
class Expected {
  std::variant<Value, Error> data_;

 public:
  Expected(const Expected&) = default;
  Expected(Expected&) = default;
  Expected(Expected&&) = default;

  template <typename Other>
  Expected(Other&& other) : data_(std::forward<Other>(other)) {}

  explicit operator bool() const noexcept {
    return std::holds_alternative<Value>(data_);
  }

  Value& operator*() { return std::get<Value>(data_); }
  const Value& operator*() const { return std::get<Value>(data_); }

  Value* operator->() { return &std::get<Value>(data_); }
  const Value* operator->() const { return &std::get<Value>(data_); }

  const Error& error() const { return std::get<Error>(data_); }

  // Return the error, or return `nullptr` if there is a value. Not for use on
  // a temporary.
  Error* if_error() & { return std::get_if<Error>(&data_); }
  const Error* if_error() const& { return std::get_if<Error>(&data_); }
  Error* if_error() && = delete;
};

}  // namespace tracing
}  // namespace correlation
