#pragma once

#include <correlation/error.h>
#include <correlation/logger.h>

#include <algorithm>
#include <cassert>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using namespace correlation::tracing;

struct MockLogger : public Logger {
  struct Entry {
    enum Kind { ERROR, STARTUP } kind;
    std::variant<std::string, Error> payload;
  };

  std::vector<Entry> entries;

  void log_error(const LogFunc& write) override {
    std::ostringstream stream;
    write(stream);
    entries.push_back(Entry{Entry::ERROR, stream.str()});
  }

  void log_startup(const LogFunc& write) override {
    std::ostringstream stream;
    write(stream);
    entries.push_back(Entry{Entry::STARTUP, stream.str()});
  }

  void log_error(const Error& error) override {
    entries.push_back(Entry{Entry::ERROR, error});
  }

  void log_error(StringView message) override {
    entries.push_back(Entry{Entry::ERROR, std::string(message)});
  }

  int count(Entry::Kind kind) const {
    return std::count_if(
        entries.begin(), entries.end(),
        [kind](const Entry& entry) { return entry.kind == kind; });
  }

  int error_count() const { return count(Entry::ERROR); }
  int startup_count() const { return count(Entry::STARTUP); }

  const Error& first_error() const {
    auto found = std::find_if(
        entries.begin(), entries.end(),
        [](const Entry& entry) { return entry.kind == Entry::ERROR; });
    assert(found != entries.end());
    return std::get<Error>(found->payload);
  }

  const std::string& first_startup() const {
    auto found = std::find_if(
        entries.begin(), entries.end(),
        [](const Entry& entry) { return entry.kind == Entry::STARTUP; });
    assert(found != entries.end());
    return std::get<std::string>(found->payload);
  }
};
