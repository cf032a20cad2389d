// This is a libFuzzer target for the parsing of correlation headers. The input
// is split at every position into a "traceparent" value and a "request-id"
// value, each of which is extracted, checked, and injected again.

#include <correlation/correlator.h>
#include <correlation/dict_reader.h>
#include <correlation/dict_writer.h>
#include <correlation/null_logger.h>
#include <correlation/optional.h>
#include <correlation/string_view.h>
#include <correlation/traceparent.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>

namespace cr = correlation::tracing;

namespace {

const cr::Correlator& correlator_singleton() {
  static const auto correlator = []() {
    cr::CorrelatorConfig config;
    config.logger = std::make_shared<cr::NullLogger>();
    config.log_on_startup = false;

    const auto finalized_config = cr::finalize_config(config);
    if (!finalized_config) {
      std::abort();
    }

    return cr::Correlator{*finalized_config};
  }();

  return correlator;
}

struct MockDictReader : public cr::DictReader {
  cr::StringView traceparent;
  cr::StringView request_id;

  cr::Optional<cr::StringView> lookup(cr::StringView key) const override {
    if (key == "traceparent") {
      return traceparent;
    }
    if (key == "request-id") {
      return request_id;
    }
    return cr::nullopt;
  }
};

struct MockDictWriter : public cr::DictWriter {
  void set(cr::StringView, cr::StringView) override {}
};

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data,
                                      std::size_t size) {
  const auto& correlator = correlator_singleton();

  const auto text = reinterpret_cast<const char*>(data);
  for (std::size_t split = 0; split <= size; ++split) {
    MockDictReader reader;
    reader.traceparent = cr::StringView(text, split);
    reader.request_id = cr::StringView(text + split, size - split);

    auto correlation = correlator.extract(reader);
    const cr::Traceparent& context = correlation.trace_context;
    if (!cr::Traceparent::is_valid_trace_id(context.trace_id())) {
      std::abort();
    }

    MockDictWriter writer;
    correlator.inject(context, writer);
  }

  return 0;
}
