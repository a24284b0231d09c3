#include "protocol.hpp"

#include <vector>

HeaderBytes encode_header(const FrameHeader& header) {
  HeaderBytes out{};
  const uint32_t fields[2] = {header.path_length, header.file_size};
  for(std::size_t f = 0; f < 2; ++f) {
    out[f * 4 + 0] = static_cast<unsigned char>((fields[f] >> 24) & 0xFFu);
    out[f * 4 + 1] = static_cast<unsigned char>((fields[f] >> 16) & 0xFFu);
    out[f * 4 + 2] = static_cast<unsigned char>((fields[f] >> 8) & 0xFFu);
    out[f * 4 + 3] = static_cast<unsigned char>(fields[f] & 0xFFu);
  }
  return out;
}

FrameHeader decode_header(const HeaderBytes& bytes) {
  auto read_u32 = [&](std::size_t at){
    return (static_cast<uint32_t>(bytes[at]) << 24) |
           (static_cast<uint32_t>(bytes[at + 1]) << 16) |
           (static_cast<uint32_t>(bytes[at + 2]) << 8) |
           static_cast<uint32_t>(bytes[at + 3]);
  };
  FrameHeader header;
  header.path_length = read_u32(0);
  header.file_size = read_u32(4);
  return header;
}

void write_frame_header(ByteChannel& channel, const std::string& path, uint32_t file_size) {
  FrameHeader header;
  header.path_length = static_cast<uint32_t>(path.size());
  header.file_size = file_size;
  auto encoded = encode_header(header);

  std::vector<unsigned char> buffer;
  buffer.reserve(encoded.size() + path.size());
  buffer.insert(buffer.end(), encoded.begin(), encoded.end());
  buffer.insert(buffer.end(), path.begin(), path.end());
  channel.send_all(buffer.data(), buffer.size());
}

void write_terminator(ByteChannel& channel) {
  auto encoded = encode_header(FrameHeader{});
  channel.send_all(encoded.data(), encoded.size());
}

void write_command(ByteChannel& channel, char command) {
  channel.send_all(&command, 1);
}

std::optional<FrameHeader> read_frame_header(ByteChannel& channel) {
  HeaderBytes bytes{};
  if(read_up_to(channel, bytes.data(), bytes.size()) != bytes.size()) {
    return std::nullopt;
  }
  return decode_header(bytes);
}

std::size_t read_up_to(ByteChannel& channel, void* buffer, std::size_t size) {
  auto* out = static_cast<unsigned char*>(buffer);
  std::size_t received = 0;
  while(received < size) {
    std::size_t n = channel.receive_some(out + received, size - received);
    if(n == 0) break;
    received += n;
  }
  return received;
}

void read_exact(ByteChannel& channel, void* buffer, std::size_t size) {
  std::size_t received = read_up_to(channel, buffer, size);
  if(received != size) {
    throw ChannelError("stream closed after " + std::to_string(received) +
                       " of " + std::to_string(size) + " bytes");
  }
}

char read_command(ByteChannel& channel) {
  char command = 0;
  if(channel.receive_some(&command, 1) == 0) {
    throw ChannelError("peer closed the connection");
  }
  return command;
}
