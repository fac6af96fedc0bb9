#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tandem/event-loop.hpp"
#include "tandem/event.hpp"
#include "tandem/poll-result.hpp"
#include "tandem/timedef.hpp"
#include "tandem/waker.hpp"

namespace tandem {

// Type-erased connection, as seen by the Multiplexer.
class IDrivenConnection {
 public:
  virtual ~IDrivenConnection() = default;

  virtual PollResult poll() = 0;

  virtual void setWaker(Waker waker) = 0;
};

template <class C>
class DrivenConnection : public IDrivenConnection {
 public:
  template <class... Args>
  explicit DrivenConnection(Args&&... args) : _connection(std::forward<Args>(args)...) {}

  PollResult poll() override { return _connection.poll(); }

  void setWaker(Waker waker) override { _connection.setWaker(std::move(waker)); }

  C& connection() noexcept { return _connection; }

 private:
  C _connection;
};

// Drives many connections cooperatively from a single thread, over an epoll based EventLoop.
// Each connection is keyed by the file descriptor of its transport, and its read or write interest follows the
// suspension reason it reports. Connections that stopped on their byte budget are polled again at the next iteration
// without waiting. Connections suspended on their task are parked until their Waker (see ServiceContext::waker()) is
// called, possibly from another thread. Terminated connections are removed and destroyed, closing their transport.
class Multiplexer {
 public:
  static constexpr SysDuration kDefaultPollTimeout = std::chrono::milliseconds{100};

  explicit Multiplexer(SysDuration pollTimeout = kDefaultPollTimeout);

  // Registers a connection whose transport operates on 'fd'. It is polled at the next iteration.
  // Throws std::system_error if fd cannot be monitored.
  void add(int fd, std::unique_ptr<IDrivenConnection> connection);

  // Constructs a connection of type C in place, and registers it.
  template <class C, class... Args>
  C& emplace(int fd, Args&&... args) {
    auto driven = std::make_unique<DrivenConnection<C>>(std::forward<Args>(args)...);
    C& connection = driven->connection();
    add(fd, std::move(driven));
    return connection;
  }

  // Waits for readiness or a wake (not waiting if some connection is runnable) and drives every ready connection until
  // it suspends or terminates. Returns the number of connections polled.
  std::size_t runOnce();

  // Calls runOnce() until no connection remains.
  void run();

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

 private:
  // Interest of a connection whose fd is deregistered while it waits for a wake.
  static constexpr EventBmp kParked = 0;

  struct Entry {
    std::unique_ptr<IDrivenConnection> connection;
    EventBmp interest;
  };

  void drive(int fd);
  void setInterest(int fd, Entry& entry, EventBmp interest);
  void park(int fd, Entry& entry);
  void remove(int fd);

  EventLoop _eventLoop;
  SysDuration _pollTimeout;
  std::shared_ptr<internal::WakeQueue> _wakeQueue;
  std::unordered_map<int, Entry> _entries;
  // Connections to poll at the next iteration regardless of readiness.
  std::vector<int> _runnable;
  std::vector<int> _toDrive;
  std::vector<int> _woken;
};

}  // namespace tandem
