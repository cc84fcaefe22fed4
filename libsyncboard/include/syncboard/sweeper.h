/**
 * @file sweeper.h
 * @brief Fixed-interval background task
 *
 * Drives work that must happen regardless of request traffic: file expiry
 * and idle-client reaping. The task runs on a dedicated thread, first one
 * interval after start(), and stop() interrupts the wait immediately.
 */

#ifndef SYNCBOARD_SWEEPER_H
#define SYNCBOARD_SWEEPER_H

#include "error.h"
#include "platform.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace syncboard {

class SYNCBOARD_API Sweeper {
public:
  using Task = std::function<void()>;

  /**
   * @param name Used in log lines
   */
  explicit Sweeper(std::string name = "sweeper");
  ~Sweeper();

  // Non-copyable
  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  /**
   * @brief Start calling `task` every `interval`
   * @return AlreadyInitialized if running, InvalidArgument for a
   *         non-positive interval or empty task
   */
  Result<void> start(std::chrono::milliseconds interval, Task task);

  /**
   * @brief Stop and join the thread; waits for a running task to finish
   */
  void stop();

  bool is_running() const;

  /// Number of completed task runs since construction
  uint64_t run_count() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace syncboard

#endif // SYNCBOARD_SWEEPER_H
