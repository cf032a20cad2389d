#pragma once

// This component provides platform-dependent miscellanea.

namespace correlation {
namespace tracing {

// Arrange for the specified `on_fork` to be invoked in the child process
// whenever this process forks. Return zero on success, or an `errno` value on
// failure.
int at_fork_in_child(void (*on_fork)());

}  // namespace tracing
}  // namespace correlation
