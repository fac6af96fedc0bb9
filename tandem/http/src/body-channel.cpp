#include "tandem/body-channel.hpp"

#include <string_view>

#include "tandem/body-stream.hpp"

namespace tandem {

void BodyChannel::offer(std::string_view data) {
  if (_abandoned) {
    return;
  }
  _buffer.append(data);
  _wantsData = false;
}

BodyPoll BodyChannel::poll() {
  if (_delivered) {
    _buffer.clear();
    _delivered = false;
  }
  if (!_buffer.empty()) {
    _delivered = true;
    return BodyPoll::Data(_buffer.view());
  }
  switch (_state) {
    case State::Finished:
      return BodyPoll::End();
    case State::Failed:
      return BodyPoll::Error(_error);
    default:
      _wantsData = true;
      return BodyPoll::Pending();
  }
}

void BodyChannel::abandon() noexcept {
  _abandoned = true;
  _wantsData = false;
  _buffer.clear();
  _delivered = false;
}

IncomingBodyStream::~IncomingBodyStream() {
  if (_channel) {
    _channel->abandon();
  }
}

}  // namespace tandem
