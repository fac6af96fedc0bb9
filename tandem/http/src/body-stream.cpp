#include "tandem/body-stream.hpp"

#include <cstdint>
#include <string>

namespace tandem {

BodyPoll StringChunksStream::pollChunk() {
  if (_pos == _chunks.size()) {
    return BodyPoll::End();
  }
  return BodyPoll::Data(_chunks[_pos++]);
}

uint64_t StringChunksStream::totalSize() const noexcept {
  uint64_t total = 0;
  for (const std::string& chunk : _chunks) {
    total += chunk.size();
  }
  return total;
}

}  // namespace tandem
