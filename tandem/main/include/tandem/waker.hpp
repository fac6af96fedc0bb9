#pragma once

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "tandem/event-fd.hpp"

namespace tandem {

namespace internal {

// Keys of the connections woken since the last take(), with the eventfd interrupting the loop that drives them.
// Protected by a lock since wakers may be called from other threads.
class WakeQueue {
 public:
  [[nodiscard]] int fd() const noexcept { return _eventFd.fd(); }

  void push(int key);

  // Drains the eventfd and swaps the woken keys into 'out' (cleared first).
  void take(std::vector<int>& out);

 private:
  std::mutex _mutex;
  std::vector<int> _keys;
  EventFd _eventFd;
};

}  // namespace internal

// Handle given to a service through its ServiceContext, to signal that a connection suspended on its task (service
// or outbound body stream returning Pending) may progress again. Copyable, and callable from any thread.
// A default constructed Waker, as for connections polled directly, wakes nothing.
class Waker {
 public:
  Waker() noexcept = default;

  Waker(std::shared_ptr<internal::WakeQueue> queue, int key) noexcept : _queue(std::move(queue)), _key(key) {}

  void wake() const;

  explicit operator bool() const noexcept { return _queue != nullptr; }

 private:
  std::shared_ptr<internal::WakeQueue> _queue;
  int _key{-1};
};

}  // namespace tandem
