/**
 * @file sweeper.cpp
 * @brief Periodic background task implementation
 */

#include "syncboard/sweeper.h"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>

namespace syncboard {

class Sweeper::Impl {
public:
  std::string name;
  std::thread thread;
  std::mutex mutex;
  std::condition_variable cv;
  bool stop_requested = false;
  std::atomic<bool> running{false};
  std::atomic<uint64_t> runs{0};

  void loop(std::chrono::milliseconds interval, Task task) {
    std::unique_lock<std::mutex> lock(mutex);
    while (true) {
      if (cv.wait_for(lock, interval, [this] { return stop_requested; })) {
        break;
      }

      lock.unlock();
      try {
        task();
      } catch (const std::exception &e) {
        spdlog::error("{} task failed: {}", name, e.what());
      }
      runs.fetch_add(1);
      lock.lock();
    }
  }
};

Sweeper::Sweeper(std::string name) : impl_(std::make_unique<Impl>()) {
  impl_->name = std::move(name);
}

Sweeper::~Sweeper() { stop(); }

Result<void> Sweeper::start(std::chrono::milliseconds interval, Task task) {
  SYNCBOARD_REQUIRE(interval.count() > 0, ErrorCode::InvalidArgument,
                    "Interval must be positive");
  SYNCBOARD_REQUIRE(static_cast<bool>(task), ErrorCode::InvalidArgument,
                    "Task must not be empty");

  if (impl_->running.load()) {
    return Error(ErrorCode::AlreadyInitialized, impl_->name + " already running");
  }

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stop_requested = false;
  }

  impl_->running.store(true);
  impl_->thread = std::thread(
      [this, interval, task = std::move(task)]() { impl_->loop(interval, task); });

  spdlog::debug("{} started ({} ms interval)", impl_->name, interval.count());
  return Result<void>::ok();
}

void Sweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stop_requested = true;
  }
  impl_->cv.notify_all();

  if (impl_->thread.joinable()) {
    impl_->thread.join();
    spdlog::debug("{} stopped", impl_->name);
  }
  impl_->running.store(false);
}

bool Sweeper::is_running() const { return impl_->running.load(); }

uint64_t Sweeper::run_count() const { return impl_->runs.load(); }

} // namespace syncboard
