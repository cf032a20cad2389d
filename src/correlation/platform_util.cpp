#include "platform_util.h"

#include <pthread.h>

namespace correlation {
namespace tracing {

int at_fork_in_child(void (*on_fork)()) {
  // https://pubs.opengroup.org/onlinepubs/9699919799/functions/pthread_atfork.html
  return pthread_atfork(/*before fork*/ nullptr, /*in parent*/ nullptr,
                        /*in child*/ on_fork);
}

}  // namespace tracing
}  // namespace correlation
