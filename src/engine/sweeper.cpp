#include "ttl_cache/sweeper.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace ttl_cache {
namespace {
// Longest single wait; wait_for on a much longer interval overflows the
// steady clock's nanosecond arithmetic.
constexpr Duration kMaxWaitSlice = std::chrono::hours(24);
} // namespace

Sweeper::Sweeper(Duration interval, Task task)
    : interval_(interval), task_(std::move(task)) {}

Sweeper::~Sweeper() { stop(); }

void Sweeper::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_ || stop_requested_)
    return;
  started_ = true;
  thread_ = std::thread(&Sweeper::loop, this);
}

void Sweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  std::lock_guard<std::mutex> join_lock(join_mu_);
  if (thread_.joinable())
    thread_.join();
}

bool Sweeper::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return started_ && !stop_requested_;
}

void Sweeper::loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_requested_) {
    Duration left = interval_;
    while (left > Duration::zero() && !stop_requested_) {
      const auto slice = std::min(left, kMaxWaitSlice);
      cv_.wait_for(lock, slice, [this] { return stop_requested_; });
      left -= slice;
    }
    if (stop_requested_)
      break;
    task_();
    ++runs_;
  }
}

} // namespace ttl_cache
