#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

// Raised for any transport failure on a live channel (reset, broken pipe,
// peer closed mid-frame). The sync loop treats it as "resume the session".
class ChannelError : public std::runtime_error {
public:
  explicit ChannelError(const std::string& what) : std::runtime_error(what) {}
};

// Blocking duplex byte stream between the two peers.
class ByteChannel {
public:
  virtual ~ByteChannel() = default;

  // Writes every byte or throws ChannelError.
  virtual void send_all(const void* data, std::size_t size) = 0;

  // Blocks until at least one byte is available. Returns 0 once the other
  // side has closed the stream; throws ChannelError on transport errors.
  virtual std::size_t receive_some(void* buffer, std::size_t size) = 0;

  virtual void close() = 0;
};
