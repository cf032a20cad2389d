// These are tests for `CerrLogger`, the default `Logger`.

#include <correlation/error.h>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "cerr_logger.h"
#include "test.h"

using namespace correlation::tracing;

#define CERR_LOGGER_TEST(x) TEST_CASE(x, "[cerr_logger]")

CERR_LOGGER_TEST("each message is one labeled line") {
  std::ostringstream output;
  CerrLogger logger{output};

  logger.log_startup([](std::ostream& log) { log << "configured"; });
  logger.log_error([](std::ostream& log) { log << "oops " << 42; });
  logger.log_error("plain text");

  REQUIRE(output.str() ==
          "[correlation startup] configured\n"
          "[correlation error] oops 42\n"
          "[correlation error] plain text\n");
}

CERR_LOGGER_TEST("errors include their code") {
  std::ostringstream output;
  CerrLogger logger{output};

  logger.log_error(Error{Error::MISSING_INJECTION_STYLE, "no styles"});

  REQUIRE(output.str() ==
          "[correlation error] [correlation error code 4] no styles\n");
}

CERR_LOGGER_TEST("concurrent messages are not interleaved") {
  std::ostringstream output;
  CerrLogger logger{output};
  const int messages_per_thread = 200;

  std::vector<std::thread> threads;
  for (const char letter : {'a', 'b', 'c', 'd'}) {
    threads.emplace_back([&logger, letter]() {
      for (int i = 0; i < messages_per_thread; ++i) {
        logger.log_error([letter](std::ostream& log) {
          log << std::string(32, letter);
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::istringstream lines{output.str()};
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    ++count;
    const std::string prefix = "[correlation error] ";
    REQUIRE(line.size() == prefix.size() + 32);
    REQUIRE(line.compare(0, prefix.size(), prefix) == 0);
    REQUIRE(line.find_first_not_of(line.back(), prefix.size()) ==
            std::string::npos);
  }
  REQUIRE(count == 4 * messages_per_thread);
}
