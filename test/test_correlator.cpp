// These are tests for `Correlator`, which extracts trace context from the
// headers of inbound requests and injects it into the headers of outbound
// requests.

#include <correlation/correlator.h>
#include <correlation/tags.h>
#include <correlation/version.h>

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "mocks/dict_readers.h"
#include "mocks/dict_writers.h"
#include "mocks/id_generators.h"
#include "mocks/loggers.h"
#include "test.h"

using namespace correlation::tracing;

namespace {

const std::string trace_id = "4bf92f3577b34da6a3ce929d0e0e4736";
const std::string span_id = "00f067aa0ba902b7";
const std::string traceparent = "00-" + trace_id + "-" + span_id + "-01";
const std::string request_id =
    "|abcdefabcdefabcdefabcdefabcdef01.1234567812345678.";

Correlator make_correlator(CorrelatorConfig config) {
  config.logger = std::make_shared<MockLogger>();
  config.log_on_startup = false;
  auto finalized = finalize_config(config);
  REQUIRE(finalized);
  return Correlator{*finalized};
}

bool was_generated_trace_id(const std::string& id) {
  return id.rfind(MockIDGenerator::trace_id_prefix, 0) == 0;
}

}  // namespace

TEST_CASE("Correlator::extract", "[correlator]") {
  CorrelatorConfig config;
  config.id_generator = std::make_shared<MockIDGenerator>();
  std::unordered_map<std::string, std::string> headers;

  SECTION("traceparent") {
    headers["traceparent"] = traceparent;
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(correlation.trace_context.serialize() == traceparent);
    REQUIRE(correlation.tags.empty());
  }

  SECTION("malformed traceparent is tagged") {
    headers["traceparent"] = "00-" + trace_id + "-0000000000000000-01";
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(was_generated_trace_id(correlation.trace_context.trace_id()));
    REQUIRE(correlation.tags.size() == 1);
    REQUIRE(correlation.tags.at(tags::internal::w3c_extraction_error) ==
            "malformed_parentid");
  }

  SECTION("request-id") {
    headers["request-id"] = request_id;
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    const auto& context = correlation.trace_context;
    REQUIRE(context.trace_id() == "abcdefabcdefabcdefabcdefabcdef01");
    REQUIRE(context.span_id() == "1234567812345678");
    REQUIRE(context.parent_id() == request_id);
    REQUIRE(correlation.tags.empty());
  }

  SECTION("request-id with an unusable root is tagged") {
    headers["request-id"] = "|not-a-valid-root.span123.";
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(was_generated_trace_id(correlation.trace_context.trace_id()));
    REQUIRE(correlation.tags.size() == 1);
    REQUIRE(correlation.tags.at(tags::legacy_root_id) == "not-a-valid-root");
    REQUIRE(correlation.tags.at("ai_legacyRootID") == "not-a-valid-root");
  }

  SECTION("traceparent is preferred by default") {
    headers["traceparent"] = traceparent;
    headers["request-id"] = request_id;
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(correlation.trace_context.serialize() == traceparent);
  }

  SECTION("style order decides which header is preferred") {
    config.extraction_styles =
        std::vector<PropagationStyle>{PropagationStyle::REQUEST_ID,
                                      PropagationStyle::W3C};
    headers["traceparent"] = traceparent;
    headers["request-id"] = request_id;
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(correlation.trace_context.parent_id() == request_id);
  }

  SECTION("empty headers are skipped") {
    headers["traceparent"] = "";
    headers["request-id"] = request_id;
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(correlation.trace_context.parent_id() == request_id);
  }

  SECTION("headers of styles not configured are ignored") {
    config.extraction_styles =
        std::vector<PropagationStyle>{PropagationStyle::REQUEST_ID};
    headers["traceparent"] = traceparent;
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(was_generated_trace_id(correlation.trace_context.trace_id()));
    REQUIRE_FALSE(correlation.trace_context.parent_id());
    REQUIRE(correlation.tags.empty());
  }

  SECTION("style none extracts nothing") {
    config.extraction_styles =
        std::vector<PropagationStyle>{PropagationStyle::NONE};
    headers["traceparent"] = traceparent;
    headers["request-id"] = request_id;
    const auto correlation = make_correlator(config).extract(
        MockDictReader{headers});
    REQUIRE(was_generated_trace_id(correlation.trace_context.trace_id()));
    REQUIRE_FALSE(correlation.trace_context.parent_id());
  }

  SECTION("no headers starts a new trace") {
    const auto correlation =
        make_correlator(config).extract(MockDictReader{});
    const auto& context = correlation.trace_context;
    REQUIRE(was_generated_trace_id(context.trace_id()));
    REQUIRE(context.version() == "00");
    REQUIRE(context.trace_flags() == "01");
    REQUIRE(correlation.tags.empty());
  }
}

TEST_CASE("Correlator::extract reads headers in style order",
          "[correlator]") {
  CorrelatorConfig config;
  std::unordered_map<std::string, std::string> headers;
  using Lookups = std::vector<std::string>;

  SECTION("every configured header is tried when none is present") {
    MockDictReader reader{headers};
    make_correlator(config).extract(reader);
    REQUIRE(reader.lookups == Lookups{"traceparent", "request-id"});
  }

  SECTION("the first header present ends the search") {
    headers["traceparent"] = traceparent;
    headers["request-id"] = request_id;
    MockDictReader reader{headers};
    make_correlator(config).extract(reader);
    REQUIRE(reader.lookups == Lookups{"traceparent"});
  }

  SECTION("reversed order") {
    config.extraction_styles =
        std::vector<PropagationStyle>{PropagationStyle::REQUEST_ID,
                                      PropagationStyle::W3C};
    MockDictReader reader{headers};
    make_correlator(config).extract(reader);
    REQUIRE(reader.lookups == Lookups{"request-id", "traceparent"});
  }

  SECTION("an empty header does not end the search") {
    headers["traceparent"] = "";
    MockDictReader reader{headers};
    make_correlator(config).extract(reader);
    REQUIRE(reader.lookups == Lookups{"traceparent", "request-id"});
  }

  SECTION("style none reads nothing") {
    config.extraction_styles =
        std::vector<PropagationStyle>{PropagationStyle::NONE};
    headers["traceparent"] = traceparent;
    MockDictReader reader{headers};
    make_correlator(config).extract(reader);
    REQUIRE(reader.lookups.empty());
  }
}

TEST_CASE("Correlator::extract of arbitrary header text", "[correlator]") {
  // Every division of the text into a "traceparent" part and a "request-id"
  // part, including empty parts at either end, yields a usable context.
  const std::string text = "00-" + trace_id + "-|" + span_id + ".x,";
  const auto correlator = make_correlator(CorrelatorConfig{});

  for (std::size_t split = 0; split <= text.size(); ++split) {
    CAPTURE(split);
    std::unordered_map<std::string, std::string> headers;
    headers["traceparent"] = text.substr(0, split);
    headers["request-id"] = text.substr(split);

    const auto correlation = correlator.extract(MockDictReader{headers});
    const Traceparent& context = correlation.trace_context;
    REQUIRE(Traceparent::is_valid_trace_id(context.trace_id()));
    REQUIRE(context.version() == "00");
    REQUIRE(context.trace_flags() == "01");
  }
}

TEST_CASE("Correlator::inject", "[correlator]") {
  CorrelatorConfig config;
  const Traceparent context{traceparent};
  MockDictWriter writer;

  SECTION("both formats by default") {
    make_correlator(config).inject(context, writer);
    REQUIRE(writer.items.size() == 2);
    REQUIRE(writer.items.at("traceparent") == traceparent);
    REQUIRE(writer.items.at("request-id") ==
            "|" + trace_id + "." + span_id + ".");
  }

  SECTION("only the configured formats") {
    config.injection_styles =
        std::vector<PropagationStyle>{PropagationStyle::REQUEST_ID};
    make_correlator(config).inject(context, writer);
    REQUIRE(writer.items.size() == 1);
    REQUIRE(writer.items.count("request-id") == 1);
  }

  SECTION("style none injects nothing") {
    config.injection_styles =
        std::vector<PropagationStyle>{PropagationStyle::NONE};
    make_correlator(config).inject(context, writer);
    REQUIRE(writer.items.empty());
  }

  SECTION("a renewed span is injected") {
    Traceparent child = context;
    child.renew_span();
    make_correlator(config).inject(child, writer);
    REQUIRE(writer.items.at("traceparent") == child.serialize());
    REQUIRE(writer.items.at("request-id") == child.back_compat_id());
    REQUIRE(writer.items.at("request-id") != context.back_compat_id());
  }

  SECTION("what is injected can be extracted") {
    const auto correlator = make_correlator(config);
    correlator.inject(context, writer);
    const auto correlation = correlator.extract(MockDictReader{writer.items});
    REQUIRE(correlation.trace_context.serialize() == context.serialize());
  }
}

TEST_CASE("Correlator::config", "[correlator]") {
  CorrelatorConfig config;
  config.injection_styles =
      std::vector<PropagationStyle>{PropagationStyle::W3C};

  const auto json = nlohmann::json::parse(make_correlator(config).config());
  REQUIRE(json.at("version") == correlation_version_string);
  REQUIRE(json.at("extraction_styles") ==
          nlohmann::json::array({"tracecontext", "request-id"}));
  REQUIRE(json.at("injection_styles") ==
          nlohmann::json::array({"tracecontext"}));
  REQUIRE(json.at("environment_variables").is_object());
}
