#pragma once

#include <cstddef>
#include <cstdint>

namespace tandem {

// Per-connection limits and policies, shared by the server and client roles.
// Plain aggregate with documented defaults. Use the withXxx setters for fluent construction and call validate()
// before handing it to a connection (connections validate it again on construction).
struct ConnectionConfig {
  // ============================
  // Head parsing limits
  // ============================
  // Maximum size (in bytes) of a message head (start line + all headers + CRLFCRLF). Also bounds the trailer section
  // of a chunked body. Exceeding it fails with HeadTooLarge (431 for the server role). Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum number of header lines in a head. Default: 64.
  std::size_t maxHeaderCount{64};

  // ============================
  // Body limits
  // ============================
  // Maximum size (in bytes) of a decoded inbound body. 0 means unlimited. Default: 256 MiB.
  std::size_t maxBodyBytes{std::size_t{1} << 28};

  // Maximum size (in bytes) of a single inbound chunk. Default: 16 MiB.
  std::size_t maxChunkBytes{std::size_t{1} << 24};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // Whether persistent connections are offered (client) and honored (server). When false, every exchange ends
  // the connection. Default: true.
  bool enableKeepAlive{true};

  // Maximum number of exchanges over a single connection before closing it. 0 means unlimited.
  uint32_t maxExchangesPerConnection{0};

  // ============================
  // Outbound body production
  // ============================
  // Outgoing Streaming chunks larger than this hint are split into several chunk frames. 0 keeps producer chunks
  // as they are.
  std::size_t streamingChunkSizeHint{0};

  // Adds a 'date' header (RFC 7231 IMF-fixdate) to server responses that do not carry one. Default: false.
  bool addDateHeader{false};

  // ============================
  // I/O tuning
  // ============================
  // Number of bytes requested from the transport in a single read. Default: 4 KiB.
  std::size_t readChunkBytes{4096};

  // Upper bound on the number of bytes read + written by a single poll() call, so that a multiplexer stays fair
  // across connections. When reached, poll() returns Progress. 0 means unlimited.
  std::size_t maxBytesPerPoll{0};

  ConnectionConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ConnectionConfig& withMaxHeaderCount(std::size_t maxHeaderCount);

  ConnectionConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  ConnectionConfig& withMaxChunkBytes(std::size_t maxChunkBytes);

  ConnectionConfig& withKeepAliveMode(bool on = true);

  ConnectionConfig& withMaxExchangesPerConnection(uint32_t maxExchanges);

  ConnectionConfig& withStreamingChunkSizeHint(std::size_t chunkSizeHint);

  ConnectionConfig& withDateHeader(bool on = true);

  ConnectionConfig& withReadChunkBytes(std::size_t readChunkBytes);

  ConnectionConfig& withMaxBytesPerPoll(std::size_t maxBytesPerPoll);

  // Throws std::invalid_argument if some values are out of range.
  void validate() const;

  bool operator==(const ConnectionConfig&) const noexcept = default;
};

}  // namespace tandem
