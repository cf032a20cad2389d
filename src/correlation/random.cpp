#include "random.h"

#include <random>

#include "platform_util.h"

namespace correlation {
namespace tracing {
namespace {

extern "C" void on_fork();

class Uint64Generator {
  std::mt19937_64 generator_;
  // Trace IDs use all 128 bits, so the full range of `std::uint64_t` is
  // drawn from.
  std::uniform_int_distribution<std::uint64_t> distribution_;

 public:
  Uint64Generator() {
    seed_with_random();
    // After `fork`, the parent and child would otherwise produce the same
    // sequence of IDs until one of them calls `exec`, which some servers
    // never do.
    (void)at_fork_in_child(&on_fork);
  }

  std::uint64_t operator()() { return distribution_(generator_); }

  void seed_with_random() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    generator_.seed(seed);
  }
};

thread_local Uint64Generator thread_local_generator;

void on_fork() { thread_local_generator.seed_with_random(); }

}  // namespace

std::uint64_t random_uint64() { return thread_local_generator(); }

}  // namespace tracing
}  // namespace correlation
