// This program plays the part of a service in the middle of a call chain. It
// reads the correlation headers of an inbound request from its command line,
// extracts a trace context from them, starts a span of its own, and prints
// the headers it would send with an outbound request.
//
//     $ correlate traceparent=00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01
//     $ correlate request-id='|4bf92f3577b34da6a3ce929d0e0e4736.00f067aa0ba902b7.'
//     $ CORRELATION_PROPAGATION_STYLE=request-id correlate
//
// Configuration is taken from the environment, e.g.
// CORRELATION_PROPAGATION_STYLE_EXTRACT.

#include <correlation/correlator.h>
#include <correlation/correlator_config.h>
#include <correlation/dict_reader.h>
#include <correlation/dict_writer.h>

#include <iostream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cr = correlation::tracing;

namespace {

class HeaderReader : public cr::DictReader {
  const std::unordered_map<std::string, std::string>& headers_;

 public:
  explicit HeaderReader(
      const std::unordered_map<std::string, std::string>& headers)
      : headers_(headers) {}

  cr::Optional<cr::StringView> lookup(cr::StringView key) const override {
    auto found = headers_.find(std::string(key));
    if (found == headers_.end()) {
      return cr::nullopt;
    }
    return found->second;
  }
};

class HeaderPrinter : public cr::DictWriter {
 public:
  void set(cr::StringView key, cr::StringView value) override {
    std::cout << key << ": " << value << '\n';
  }
};

void usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [HEADER_NAME=HEADER_VALUE ...]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::unordered_map<std::string, std::string> headers;
  for (const char* const* arg = argv + 1; *arg; ++arg) {
    const std::string_view header = *arg;
    const auto equal = header.find('=');
    if (equal == std::string_view::npos) {
      usage(argv[0]);
      return 1;
    }
    headers.insert_or_assign(std::string(header.substr(0, equal)),
                             std::string(header.substr(equal + 1)));
  }

  cr::CorrelatorConfig config;
  config.log_on_startup = false;
  const auto finalized = cr::finalize_config(config);
  if (const auto* error = finalized.if_error()) {
    std::cerr << "Invalid correlator config: " << *error << '\n';
    return 1;
  }
  const cr::Correlator correlator{*finalized};

  auto correlation = correlator.extract(HeaderReader{headers});
  cr::Traceparent& context = correlation.trace_context;

  std::cout << "Inbound trace context:\n"
            << "  version:     " << context.version() << '\n'
            << "  trace ID:    " << context.trace_id() << '\n'
            << "  span ID:     " << context.span_id() << '\n'
            << "  trace flags: " << context.trace_flags() << '\n'
            << "  parent ID:   " << context.parent_id().value_or("(none)")
            << '\n';
  for (const auto& [name, value] : correlation.tags) {
    std::cout << "  tag " << name << ": " << value << '\n';
  }

  context.renew_span();
  std::cout << "\nOutbound headers:\n";
  HeaderPrinter printer;
  correlator.inject(context, printer);
}
