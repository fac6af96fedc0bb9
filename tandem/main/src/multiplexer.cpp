#include "tandem/multiplexer.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

#include "tandem/event-loop.hpp"
#include "tandem/event.hpp"
#include "tandem/log.hpp"
#include "tandem/poll-result.hpp"
#include "tandem/timedef.hpp"
#include "tandem/waker.hpp"

namespace tandem {

Multiplexer::Multiplexer(SysDuration pollTimeout)
    : _eventLoop(pollTimeout), _pollTimeout(pollTimeout), _wakeQueue(std::make_shared<internal::WakeQueue>()) {
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _wakeQueue->fd()});
}

void Multiplexer::add(int fd, std::unique_ptr<IDrivenConnection> connection) {
  _eventLoop.addOrThrow(EventLoop::EventFd{EventReadInterest, fd});
  connection->setWaker(Waker(_wakeQueue, fd));
  _entries.insert_or_assign(fd, Entry{std::move(connection), EventReadInterest});
  _runnable.push_back(fd);
  log::debug("Multiplexer registered fd # {} ({} connection(s))", fd, _entries.size());
}

std::size_t Multiplexer::runOnce() {
  _eventLoop.updatePollTimeout(_runnable.empty() ? _pollTimeout : SysDuration{});

  _toDrive.clear();
  for (const EventLoop::EventFd& event : _eventLoop.poll()) {
    if (event.fd == _wakeQueue->fd()) {
      _wakeQueue->take(_woken);
      _toDrive.insert(_toDrive.end(), _woken.begin(), _woken.end());
    } else {
      _toDrive.push_back(event.fd);
    }
  }
  _toDrive.insert(_toDrive.end(), _runnable.begin(), _runnable.end());
  _runnable.clear();

  std::ranges::sort(_toDrive);
  const auto [first, last] = std::ranges::unique(_toDrive);
  _toDrive.erase(first, last);

  std::size_t nbPolled = 0;
  for (int fd : _toDrive) {
    if (_entries.contains(fd)) {
      drive(fd);
      ++nbPolled;
    }
  }
  return nbPolled;
}

void Multiplexer::run() {
  while (!_entries.empty()) {
    runOnce();
  }
}

void Multiplexer::drive(int fd) {
  Entry& entry = _entries.find(fd)->second;
  PollResult res = entry.connection->poll();
  while (res.status == PollStatus::PhaseComplete) {
    res = entry.connection->poll();
  }

  switch (res.status) {
    case PollStatus::Terminal:
      remove(fd);
      break;
    case PollStatus::Suspended:
      switch (res.reason) {
        case SuspendReason::Readable:
          setInterest(fd, entry, EventReadInterest);
          break;
        case SuspendReason::Writable:
          setInterest(fd, entry, EventWriteInterest);
          break;
        default:
          park(fd, entry);
          break;
      }
      break;
    default:
      // byte budget reached, buffered input may remain without the stream being readable
      _runnable.push_back(fd);
      break;
  }
}

void Multiplexer::setInterest(int fd, Entry& entry, EventBmp interest) {
  if (entry.interest == interest) {
    return;
  }
  const EventLoop::EventFd event{interest, fd};
  if (entry.interest == kParked ? _eventLoop.add(event) : _eventLoop.mod(event)) {
    entry.interest = interest;
  }
}

void Multiplexer::park(int fd, Entry& entry) {
  // Level-triggered readiness of a parked connection (pipelined input, peer hang-up) would wake every poll.
  if (entry.interest != kParked) {
    _eventLoop.del(fd);
    entry.interest = kParked;
  }
  log::trace("Multiplexer parks fd # {} until woken", fd);
}

void Multiplexer::remove(int fd) {
  // the terminated connection usually closed its fd already, which also deregistered it
  if (_entries.find(fd)->second.interest != kParked) {
    _eventLoop.del(fd);
  }
  _entries.erase(fd);
  log::debug("Multiplexer removed fd # {} ({} connection(s) left)", fd, _entries.size());
}

}  // namespace tandem
