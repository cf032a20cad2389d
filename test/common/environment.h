#pragma once

#include <correlation/optional.h>

#include <cstdlib>
#include <string>
#include <utility>

namespace correlation::test {

// `EnvGuard` sets, or with `nullopt` removes, one environment variable for its
// lifetime, and then puts back whatever was there before.
class EnvGuard {
  std::string name_;
  tracing::Optional<std::string> previous_;

  static void put(const std::string& name,
                  const tracing::Optional<std::string>& value) {
    if (value) {
      ::setenv(name.c_str(), value->c_str(), /*overwrite=*/1);
    } else {
      ::unsetenv(name.c_str());
    }
  }

 public:
  EnvGuard(std::string name, tracing::Optional<std::string> value)
      : name_(std::move(name)) {
    if (const char* current = std::getenv(name_.c_str())) {
      previous_ = current;
    }
    put(name_, value);
  }

  EnvGuard(const EnvGuard&) = delete;
  EnvGuard& operator=(const EnvGuard&) = delete;

  ~EnvGuard() { put(name_, previous_); }
};

}  // namespace correlation::test
