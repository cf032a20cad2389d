#include <correlation/request_id.h>
#include <correlation/traceparent.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "string_util.h"

namespace correlation {
namespace tracing {
namespace {

constexpr StringView zero_trace_id = "00000000000000000000000000000000";
constexpr StringView zero_span_id = "0000000000000000";

bool is_lower_hex(char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

// Return whether the specified `text` consists of exactly `length` lowercase
// hexadecimal digits.
bool is_lower_hex(StringView text, std::size_t length) {
  return text.size() == length &&
         std::all_of(text.begin(), text.end(),
                     [](char ch) { return is_lower_hex(ch); });
}

// `Fields` holds the values parsed from a "traceparent" header while they are
// being checked and repaired.
struct Fields {
  const IDGenerator& generator;
  std::size_t count;
  std::string version;
  std::string trace_id;
  std::string span_id;
  std::string trace_flags;

  void regenerate_trace_id() { trace_id = generator.trace_id(); }
  void regenerate_span_id() { span_id = generator.span_id(); }
};

// Each repair step examines `Fields`, replaces whatever it finds invalid, and
// returns the name of the defect, or `nullopt` if there was none. Steps run in
// the order listed in `repair_steps`, and a step sees the replacements made by
// the steps before it.
using RepairStep = Optional<StringView> (*)(Fields&);

Optional<StringView> repair_version(Fields& fields) {
  if (is_lower_hex(fields.version, 2)) {
    return nullopt;
  }
  assign(fields.version, Traceparent::default_version);
  fields.regenerate_trace_id();
  return "invalid_version";
}

// Version 00 has exactly four fields. Later versions may append more.
Optional<StringView> repair_version_00_field_count(Fields& fields) {
  if (fields.version != "00" || fields.count == 4) {
    return nullopt;
  }
  fields.regenerate_trace_id();
  fields.regenerate_span_id();
  return "malformed_traceparent";
}

Optional<StringView> repair_forbidden_version(Fields& fields) {
  if (fields.version != "ff") {
    return nullopt;
  }
  assign(fields.version, Traceparent::default_version);
  fields.regenerate_trace_id();
  fields.regenerate_span_id();
  return "invalid_version";
}

// Only versions 00 through 0f are understood. The IDs of a higher version are
// kept, but the version itself is not.
Optional<StringView> repair_unsupported_version(Fields& fields) {
  if (fields.version.size() == 2 && fields.version[0] == '0' &&
      is_lower_hex(fields.version[1])) {
    return nullopt;
  }
  assign(fields.version, Traceparent::default_version);
  return "unsupported_version";
}

Optional<StringView> repair_trace_flags(Fields& fields) {
  if (is_lower_hex(fields.trace_flags, 2)) {
    return nullopt;
  }
  assign(fields.trace_flags, Traceparent::default_trace_flags);
  fields.regenerate_trace_id();
  return "malformed_traceflags";
}

Optional<StringView> repair_trace_id(Fields& fields) {
  if (Traceparent::is_valid_trace_id(fields.trace_id)) {
    return nullopt;
  }
  fields.regenerate_trace_id();
  return "malformed_traceid";
}

// An invalid parent span ID discredits the whole header, so the trace ID is
// replaced as well.
Optional<StringView> repair_span_id(Fields& fields) {
  if (Traceparent::is_valid_span_id(fields.span_id)) {
    return nullopt;
  }
  fields.regenerate_span_id();
  fields.regenerate_trace_id();
  return "malformed_parentid";
}

const RepairStep repair_steps[] = {
    repair_version,
    repair_version_00_field_count,
    repair_forbidden_version,
    repair_unsupported_version,
    repair_trace_flags,
    repair_trace_id,
    repair_span_id,
};

}  // namespace

Traceparent::Traceparent(Optional<StringView> traceparent,
                         Optional<StringView> request_id,
                         std::shared_ptr<const IDGenerator> generator)
    : generator_(generator ? std::move(generator) : default_id_generator()),
      version_(default_version),
      trace_flags_(default_trace_flags) {
  if (traceparent && !traceparent->empty()) {
    parse_traceparent(*traceparent);
  } else if (request_id && !request_id->empty()) {
    parse_request_id(*request_id);
  } else {
    trace_id_ = generator_->trace_id();
    span_id_ = generator_->span_id();
  }
}

void Traceparent::parse_traceparent(StringView traceparent) {
  // More than one value means that the header appeared more than once. There
  // is no telling which is right, so start over.
  if (traceparent.find(',') != StringView::npos) {
    trace_id_ = generator_->trace_id();
    span_id_ = generator_->span_id();
    extraction_error_ = "multiple_traceparent";
    return;
  }

  const std::vector<StringView> parts = split(trim(traceparent), '-');
  Fields fields{*generator_, parts.size(), version_, {}, {}, trace_flags_};
  if (parts.size() >= 4) {
    assign(fields.version, parts[0]);
    assign(fields.trace_id, parts[1]);
    assign(fields.span_id, parts[2]);
    assign(fields.trace_flags, parts[3]);
  } else {
    fields.regenerate_trace_id();
    fields.regenerate_span_id();
    extraction_error_ = "malformed_traceparent";
  }

  for (const RepairStep repair : repair_steps) {
    const auto defect = repair(fields);
    if (defect && !extraction_error_) {
      extraction_error_.emplace(*defect);
    }
  }

  version_ = std::move(fields.version);
  trace_id_ = std::move(fields.trace_id);
  span_id_ = std::move(fields.span_id);
  trace_flags_ = std::move(fields.trace_flags);
  parent_id_ = back_compat_id();
}

void Traceparent::parse_request_id(StringView request_id) {
  parent_id_.emplace(request_id);

  std::string operation_id = request_id_root(request_id);
  if (!is_valid_trace_id(operation_id)) {
    legacy_root_id_ = std::move(operation_id);
    operation_id = generator_->trace_id();
  }

  // The span ID is the innermost segment, e.g. "b" in "|root.a.b.".
  StringView parent = request_id;
  if (request_id.find('|') != StringView::npos) {
    const std::size_t last = request_id.size() - 1;
    const std::size_t dot = request_id.substr(0, last).rfind('.');
    const std::size_t begin = dot == StringView::npos ? 0 : dot + 1;
    parent = request_id.substr(begin, last - begin);
  }

  trace_id_ = std::move(operation_id);
  assign(span_id_, parent);
}

std::string Traceparent::back_compat_id() const {
  std::string result;
  result += '|';
  result += trace_id_;
  result += '.';
  result += span_id_;
  result += '.';
  return result;
}

std::string Traceparent::serialize() const {
  std::string result;
  result += version_;
  result += '-';
  result += trace_id_;
  result += '-';
  result += span_id_;
  result += '-';
  result += trace_flags_;
  return result;
}

void Traceparent::renew_span() { span_id_ = generator_->span_id(); }

bool Traceparent::is_valid_trace_id(StringView id) {
  return is_lower_hex(id, 32) && id != zero_trace_id;
}

bool Traceparent::is_valid_span_id(StringView id) {
  return is_lower_hex(id, 16) && id != zero_span_id;
}

}  // namespace tracing
}  // namespace correlation
