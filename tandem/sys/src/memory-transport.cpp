#include "tandem/memory-transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "tandem/raw-chars.hpp"
#include "tandem/transport.hpp"

namespace tandem {

namespace internal {

struct MemoryPipeState {
  RawChars toTransport;
  RawChars fromTransport;
  std::size_t writeCapacity{};
  std::size_t readChunkLimit{};
  std::size_t nbReads{};
  std::size_t nbWrites{};
  bool peerWriteClosed{};
  bool transportClosed{};
  bool failed{};
};

}  // namespace internal

MemoryTransport::~MemoryTransport() {
  if (_state) {
    _state->transportClosed = true;
  }
}

ITransport::TransportResult MemoryTransport::read(char* buf, std::size_t len) {
  ++_state->nbReads;
  if (_state->failed) {
    return {0, TransportHint::Error};
  }
  auto& input = _state->toTransport;
  if (input.empty()) {
    return {0, _state->peerWriteClosed ? TransportHint::None : TransportHint::ReadReady};
  }
  std::size_t nbBytes = std::min(len, input.size());
  if (_state->readChunkLimit != 0) {
    nbBytes = std::min(nbBytes, _state->readChunkLimit);
  }
  std::memcpy(buf, input.data(), nbBytes);
  input.erase_front(nbBytes);
  return {nbBytes, TransportHint::None};
}

ITransport::TransportResult MemoryTransport::write(std::string_view data) {
  ++_state->nbWrites;
  if (_state->failed) {
    return {0, TransportHint::Error};
  }
  auto& output = _state->fromTransport;
  std::size_t nbBytes = data.size();
  if (_state->writeCapacity != 0) {
    const std::size_t room = _state->writeCapacity > output.size() ? _state->writeCapacity - output.size() : 0;
    nbBytes = std::min(nbBytes, room);
  }
  output.append(data.substr(0, nbBytes));
  return {nbBytes, nbBytes == data.size() ? TransportHint::None : TransportHint::WriteReady};
}

void MemoryPeer::send(std::string_view data) { _state->toTransport.append(data); }

void MemoryPeer::closeWrite() { _state->peerWriteClosed = true; }

void MemoryPeer::fail() { _state->failed = true; }

void MemoryPeer::setWriteCapacity(std::size_t capacity) { _state->writeCapacity = capacity; }

void MemoryPeer::setReadChunkLimit(std::size_t limit) { _state->readChunkLimit = limit; }

std::string_view MemoryPeer::output() const noexcept { return _state->fromTransport.view(); }

std::string MemoryPeer::takeOutput() {
  std::string ret(_state->fromTransport.view());
  _state->fromTransport.clear();
  return ret;
}

std::size_t MemoryPeer::pendingInput() const noexcept { return _state->toTransport.size(); }

bool MemoryPeer::isTransportClosed() const noexcept { return _state->transportClosed; }

std::size_t MemoryPeer::nbReads() const noexcept { return _state->nbReads; }

std::size_t MemoryPeer::nbWrites() const noexcept { return _state->nbWrites; }

std::pair<std::unique_ptr<MemoryTransport>, MemoryPeer> MakeMemoryPipe() {
  auto state = std::make_shared<internal::MemoryPipeState>();
  return {std::make_unique<MemoryTransport>(state), MemoryPeer(state)};
}

}  // namespace tandem
