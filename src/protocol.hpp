#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "byte_channel.hpp"

// protocol.hpp
//
// Frame      := header || path[path_length] || content[file_size]
// header     := path_length:u32be || file_size:u32be
// Terminator := header(0, 0), nothing after it
//
// Between batches the client drives the server with one command byte.

inline constexpr std::size_t kFrameHeaderSize = 8;
inline constexpr char kCommandYouSend = 's';
inline constexpr char kCommandYouReceive = 'r';

struct FrameHeader {
  uint32_t path_length = 0;
  uint32_t file_size = 0;

  bool is_terminator() const { return path_length == 0 && file_size == 0; }
};

using HeaderBytes = std::array<unsigned char, kFrameHeaderSize>;

HeaderBytes encode_header(const FrameHeader& header);
FrameHeader decode_header(const HeaderBytes& bytes);

// Header and path go out in a single write; the payload follows separately.
void write_frame_header(ByteChannel& channel, const std::string& path, uint32_t file_size);
void write_terminator(ByteChannel& channel);
void write_command(ByteChannel& channel, char command);

// Empty when the stream ends before a whole header arrived.
std::optional<FrameHeader> read_frame_header(ByteChannel& channel);

// Reads until `size` bytes arrived or the stream ended. Returns the count.
std::size_t read_up_to(ByteChannel& channel, void* buffer, std::size_t size);

// Like read_up_to, but a short read is a ChannelError.
void read_exact(ByteChannel& channel, void* buffer, std::size_t size);

// Blocks for one command byte; end of stream is a ChannelError.
char read_command(ByteChannel& channel);
