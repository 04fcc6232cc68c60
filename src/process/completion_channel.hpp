#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace scenkit::process {

// Multi-producer, single-consumer queue of completion events for one run.
//
// Producers (exit watchers, connect attempts) push; the run's flow pops.
// Cancellation is expressed by the consumer: it stops popping and releases
// whatever the run owns. Pushes after Close() are dropped.
template <typename Event>
class CompletionChannel {
public:
  CompletionChannel() = default;

  CompletionChannel(const CompletionChannel&) = delete;
  CompletionChannel& operator=(const CompletionChannel&) = delete;

  void Push(Event event) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return;
      }
      queue_.push_back(std::move(event));
    }
    cv_.notify_one();
  }

  // Waits up to `timeout` for the next event. nullopt on timeout or when
  // the channel is closed and drained.
  template <typename Rep, typename Period>
  std::optional<Event> PopFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
    return PopLocked();
  }

  // Waits until an event arrives or the channel is closed.
  std::optional<Event> Pop() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
    return PopLocked();
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

private:
  std::optional<Event> PopLocked() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> queue_;
  bool closed_ = false;
};

} // namespace scenkit::process
