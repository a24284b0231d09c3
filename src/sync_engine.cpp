#include "sync_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <thread>

#include "peer_manager.hpp"
#include "protocol.hpp"
#include "recorder.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kSendChunkSize = 64 * 1024;

// Only the immediate parent is created; a missing grandparent is a local
// filesystem error.
void ensure_parent_directory(const std::filesystem::path& path) {
  auto parent = path.parent_path();
  if(parent.empty() || std::filesystem::exists(parent)) return;
  std::filesystem::create_directory(parent);
}

} // namespace

SyncEngine::SyncEngine(PeerLink& link,
                       Recorder& recorder,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : link_(link),
    recorder_(recorder),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync")) {
  if(options_.receive_buffer_size == 0) {
    options_.receive_buffer_size = 1;
  }
}

void SyncEngine::run() {
  for(;;) {
    step();
  }
}

void SyncEngine::step() {
  try {
    switch(link_.mode()) {
      case PeerMode::Server:
        serve_command();
        break;
      case PeerMode::Client:
        run_client_round();
        if(options_.round_interval.count() > 0) {
          std::this_thread::sleep_for(options_.round_interval);
        }
        break;
      case PeerMode::Unconnected:
        logger_->info("Not connected, negotiating a role");
        link_.resume();
        break;
    }
  } catch(const ChannelError& e) {
    logger_->warn("Connection broken ({}), trying to resume", e.what());
    ++stats_.resumes;
    link_.resume();
  }
}

void SyncEngine::serve_command() {
  auto& channel = link_.channel();
  char command = read_command(channel);
  switch(command) {
    case kCommandYouSend:
      send_files(channel);
      break;
    case kCommandYouReceive:
      if(!receive_files(channel)) {
        throw ChannelError("stream ended inside a frame header");
      }
      break;
    default:
      logger_->warn("Ignoring unknown command byte 0x{:02x}", static_cast<unsigned char>(command));
      break;
  }
}

void SyncEngine::run_client_round() {
  auto& channel = link_.channel();
  write_command(channel, kCommandYouSend);
  // a batch cut short means the server is gone; do not push into it
  if(!receive_files(channel)) {
    throw ChannelError("stream ended inside a frame header");
  }
  write_command(channel, kCommandYouReceive);
  send_files(channel);
  ++stats_.rounds;
}

void SyncEngine::send_files(ByteChannel& channel) {
  auto unsent = recorder_.unsent_files();
  if(!unsent.empty()) {
    logger_->info("New file(s) found, start to send {} file(s)", unsent.size());
  }
  for(const auto& path : unsent) {
    if(send_file(channel, path)) {
      ++stats_.files_sent;
    }
  }
  write_terminator(channel);
}

bool SyncEngine::send_file(ByteChannel& channel, const std::string& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    logger_->warn("Skipping {}: {}", path, ec.message());
    return false;
  }
  constexpr auto kMaxFramed = std::numeric_limits<uint32_t>::max();
  if(size > kMaxFramed || path.size() > kMaxFramed) {
    logger_->error("Skipping {}: {} bytes does not fit in a frame", path, size);
    return false;
  }

  recorder_.set_ownership(path, true);
  logger_->info("Sending {}", path);
  write_frame_header(channel, path, static_cast<uint32_t>(size));
  stream_file(channel, path, static_cast<uint32_t>(size));
  recorder_.add_record(path);
  return true;
}

void SyncEngine::stream_file(ByteChannel& channel, const std::string& path, uint32_t size) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw std::runtime_error("unable to open " + path + " for reading");
  }
  std::size_t remaining = size;
  std::vector<char> chunk(std::min<std::size_t>(kSendChunkSize, std::max<std::size_t>(remaining, 1)));
  while(remaining > 0) {
    std::size_t want = std::min(remaining, chunk.size());
    in.read(chunk.data(), static_cast<std::streamsize>(want));
    if(static_cast<std::size_t>(in.gcount()) != want) {
      // the header already promised `size` bytes, the stream cannot be realigned
      logger_->warn("{} shrank while it was being sent, {} byte(s) short", path, remaining);
      throw ChannelError(path + " shrank while it was being sent");
    }
    channel.send_all(chunk.data(), want);
    remaining -= want;
  }
}

bool SyncEngine::receive_files(ByteChannel& channel) {
  for(;;) {
    auto header = read_frame_header(channel);
    if(!header) {
      logger_->debug("Stream ended inside a frame header");
      return false;
    }
    if(header->is_terminator()) return true;

    std::string path(header->path_length, '\0');
    read_exact(channel, path.data(), path.size());

    if(!is_within(recorder_.share_dir(), path)) {
      logger_->warn("Rejecting '{}': outside of {}", path, recorder_.share_dir().string());
      discard(channel, header->file_size);
      ++stats_.files_rejected;
      continue;
    }

    recorder_.delete_record(path);
    recorder_.set_ownership(path, false);
    ensure_parent_directory(path);
    logger_->info("Receiving {}", path);
    receive_file(channel, path, header->file_size);
    recorder_.add_record(path);
    ++stats_.files_received;
  }
}

void SyncEngine::receive_file(ByteChannel& channel, const std::string& path, uint32_t size) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw std::runtime_error("unable to open " + path + " for writing");
  }
  std::size_t remaining = size;
  while(remaining > 0) {
    std::size_t want = chunk_size(remaining);
    if(buffer_.size() < want) buffer_.resize(want);
    std::size_t n = channel.receive_some(buffer_.data(), want);
    if(n == 0) {
      throw ChannelError("stream closed with " + std::to_string(remaining) +
                         " byte(s) of " + path + " outstanding");
    }
    out.write(buffer_.data(), static_cast<std::streamsize>(n));
    if(!out) {
      throw std::runtime_error("write to " + path + " failed");
    }
    remaining -= n;
  }
}

void SyncEngine::discard(ByteChannel& channel, uint32_t size) {
  std::size_t remaining = size;
  while(remaining > 0) {
    std::size_t want = chunk_size(remaining);
    if(buffer_.size() < want) buffer_.resize(want);
    std::size_t n = channel.receive_some(buffer_.data(), want);
    if(n == 0) {
      throw ChannelError("stream closed inside a rejected frame");
    }
    remaining -= n;
  }
}

std::size_t SyncEngine::chunk_size(std::size_t remaining) const {
  return std::min(remaining, options_.receive_buffer_size);
}
