#include "acmeflow/timer.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

#include "acmeflow/error.hpp"

namespace acmeflow {

namespace {

// wait_for adds the delay to steady_clock::now() in the clock's own ticks
constexpr std::chrono::milliseconds MAX_WAIT =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::duration::max()) / 4;

}  // namespace

void SteadyTimer::waitFor(std::chrono::milliseconds delay,
                          std::stop_token stop) {
  if (stop.stop_requested()) {
    throw OperationCancelledError();
  }

  std::mutex mutex;
  std::condition_variable_any cv;
  std::unique_lock lock(mutex);
  // Nothing else notifies cv; only the stop callback or the timeout end it
  cv.wait_for(lock, stop, std::min(delay, MAX_WAIT), [] { return false; });

  if (stop.stop_requested()) {
    throw OperationCancelledError();
  }
}

}  // namespace acmeflow
