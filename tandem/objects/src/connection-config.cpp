#include "tandem/connection-config.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace tandem {

ConnectionConfig& ConnectionConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ConnectionConfig& ConnectionConfig::withMaxHeaderCount(std::size_t maxHeaderCount) {
  this->maxHeaderCount = maxHeaderCount;
  return *this;
}

ConnectionConfig& ConnectionConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ConnectionConfig& ConnectionConfig::withMaxChunkBytes(std::size_t maxChunkBytes) {
  this->maxChunkBytes = maxChunkBytes;
  return *this;
}

ConnectionConfig& ConnectionConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

ConnectionConfig& ConnectionConfig::withMaxExchangesPerConnection(uint32_t maxExchanges) {
  this->maxExchangesPerConnection = maxExchanges;
  return *this;
}

ConnectionConfig& ConnectionConfig::withStreamingChunkSizeHint(std::size_t chunkSizeHint) {
  this->streamingChunkSizeHint = chunkSizeHint;
  return *this;
}

ConnectionConfig& ConnectionConfig::withDateHeader(bool on) {
  this->addDateHeader = on;
  return *this;
}

ConnectionConfig& ConnectionConfig::withReadChunkBytes(std::size_t readChunkBytes) {
  this->readChunkBytes = readChunkBytes;
  return *this;
}

ConnectionConfig& ConnectionConfig::withMaxBytesPerPoll(std::size_t maxBytesPerPoll) {
  this->maxBytesPerPoll = maxBytesPerPoll;
  return *this;
}

void ConnectionConfig::validate() const {
  if (std::cmp_less(maxHeaderBytes, 128)) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxHeaderCount == 0) {
    throw std::invalid_argument("maxHeaderCount must be > 0");
  }
  if (maxChunkBytes == 0) {
    throw std::invalid_argument("maxChunkBytes must be > 0");
  }
  if (readChunkBytes == 0) {
    throw std::invalid_argument("readChunkBytes must be > 0");
  }
}

}  // namespace tandem
