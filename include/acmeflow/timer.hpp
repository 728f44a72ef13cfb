/**
 * @file timer.hpp
 * @brief Cancellable delays used between status polls
 */

#pragma once

#include <chrono>
#include <stop_token>

namespace acmeflow {

class Timer {
 public:
  virtual ~Timer() = default;

  /**
   * @brief Suspend the calling thread for a delay
   * @throws OperationCancelledError if a stop is requested before or during
   *         the wait
   */
  virtual void waitFor(std::chrono::milliseconds delay,
                       std::stop_token stop) = 0;
};

/**
 * @brief Timer backed by a condition variable on the steady clock
 *
 * A stop request wakes the waiting thread immediately.
 */
class SteadyTimer : public Timer {
 public:
  void waitFor(std::chrono::milliseconds delay, std::stop_token stop) override;
};

}  // namespace acmeflow
