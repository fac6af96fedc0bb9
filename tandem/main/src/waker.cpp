#include "tandem/waker.hpp"

#include <mutex>
#include <vector>

namespace tandem {

namespace internal {

void WakeQueue::push(int key) {
  {
    std::scoped_lock<std::mutex> lock(_mutex);
    _keys.push_back(key);
  }
  _eventFd.send();
}

void WakeQueue::take(std::vector<int>& out) {
  out.clear();
  _eventFd.read();
  std::scoped_lock<std::mutex> lock(_mutex);
  out.swap(_keys);
}

}  // namespace internal

void Waker::wake() const {
  if (_queue) {
    _queue->push(_key);
  }
}

}  // namespace tandem
