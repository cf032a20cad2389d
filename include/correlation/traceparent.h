#pragma once

// This component provides a class, `Traceparent`, that holds the trace context
// of one operation: a version, a 128-bit trace ID, a 64-bit span ID, and a
// byte of trace flags, each kept as lowercase hexadecimal text.
//
// A `Traceparent` is constructed from whatever correlation header the inbound
// request carried:
//
// - the W3C "traceparent" header, e.g.
//   "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01";
// - the legacy hierarchical "request-id" header, e.g.
//   "|4bf92f3577b34da6a3ce929d0e0e4736.00f067aa0ba902b7.";
// - or nothing at all.
//
// Before a "traceparent" value is split into its fields, leading and trailing
// ASCII whitespace is removed. Other whitespace, such as a UTF-8 encoded
// no-break space, is left in place and makes the adjacent field invalid.
//
// Construction never fails. Any part of the input that is malformed is
// replaced with a newly generated value, so that the resulting object always
// satisfies the following:
//
// - `trace_id()` is 32 lowercase hex digits, not all zero;
// - `span_id()` is 16 lowercase hex digits, not all zero (except when taken
//   verbatim from a "request-id" header);
// - `version()` is 2 lowercase hex digits, and is not "ff";
// - `trace_flags()` is 2 lowercase hex digits.
//
// The result can be rendered in either wire format: `serialize()` produces a
// "traceparent" value and `back_compat_id()` produces a "request-id" value.
//
// A `Traceparent` is not synchronized. `renew_span` modifies it in place, so
// it must not be shared among concurrently executing spans.

#include <memory>
#include <string>

#include "id_generator.h"
#include "optional.h"
#include "string_view.h"

namespace correlation {
namespace tracing {

class Traceparent {
  std::shared_ptr<const IDGenerator> generator_;
  std::string version_;
  std::string trace_id_;
  std::string span_id_;
  std::string trace_flags_;
  Optional<std::string> parent_id_;
  Optional<std::string> legacy_root_id_;
  Optional<std::string> extraction_error_;

 public:
  static constexpr StringView default_version = "00";
  static constexpr StringView default_trace_flags = "01";

  // Create a trace context from the specified `traceparent` header value if
  // it is present and not empty, otherwise from the specified `request_id`
  // header value if it is present and not empty, otherwise from scratch. Use
  // the specified `generator` for any IDs that must be generated.
  explicit Traceparent(
      Optional<StringView> traceparent = nullopt,
      Optional<StringView> request_id = nullopt,
      std::shared_ptr<const IDGenerator> generator = default_id_generator());

  const std::string& version() const { return version_; }
  const std::string& trace_id() const { return trace_id_; }
  const std::string& span_id() const { return span_id_; }
  const std::string& trace_flags() const { return trace_flags_; }

  // The legacy identifier of this operation's parent, as of construction.
  // When constructed from a "traceparent" header, this is the
  // `back_compat_id()` of the parsed context. When constructed from a
  // "request-id" header, this is the header value verbatim. Otherwise, there
  // is no parent. `renew_span` does not modify the parent ID.
  const Optional<std::string>& parent_id() const { return parent_id_; }

  // The root segment of the "request-id" header this context was constructed
  // from, if that segment was not usable as a trace ID.
  const Optional<std::string>& legacy_root_id() const {
    return legacy_root_id_;
  }

  // A short description of the first defect found in the "traceparent" header
  // this context was constructed from, e.g. "malformed_traceid", if any.
  const Optional<std::string>& extraction_error() const {
    return extraction_error_;
  }

  // Return "|<trace_id>.<span_id>.".
  std::string back_compat_id() const;

  // Return "<version>-<trace_id>-<span_id>-<trace_flags>".
  std::string serialize() const;

  // Replace the span ID with a newly generated one. The trace ID, version,
  // trace flags, and parent ID are unchanged.
  void renew_span();

  // Return whether the specified `id` is 32 lowercase hex digits, not all of
  // which are zero.
  static bool is_valid_trace_id(StringView id);

  // Return whether the specified `id` is 16 lowercase hex digits, not all of
  // which are zero.
  static bool is_valid_span_id(StringView id);

 private:
  void parse_traceparent(StringView traceparent);
  void parse_request_id(StringView request_id);
};

}  // namespace tracing
}  // namespace correlation
