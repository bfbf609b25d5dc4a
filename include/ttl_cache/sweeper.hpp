#pragma once

#include "ttl_cache/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace ttl_cache {

// Runs `task` every `interval` on a background thread until stopped.
// The task runs with the sweeper's own mutex held, so once stop() has taken
// that mutex no new run can begin; a run already in progress completes
// before stop() returns. stop() must not be called from inside the task.
class Sweeper {
public:
  using Task = std::function<void()>;

  Sweeper(Duration interval, Task task);
  ~Sweeper();

  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  void start();
  void stop();

  bool running() const;
  Duration interval() const { return interval_; }
  std::uint64_t runs() const { return runs_.load(); }

private:
  void loop();

  const Duration interval_;
  Task task_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool started_{false};
  bool stop_requested_{false};
  std::atomic<std::uint64_t> runs_{0};
  std::mutex join_mu_;
  std::thread thread_;
};

} // namespace ttl_cache
