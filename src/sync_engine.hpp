#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "byte_channel.hpp"
#include "log.hpp"

class PeerLink;
class Recorder;

// Runs the sync conversation over whatever channel the PeerLink holds.
//
// The client drives every round: it asks the server to send ('s') and
// receives the batch, then announces it will send ('r') and pushes its own
// batch. The server just answers commands. A batch is any number of frames
// followed by a terminator.
class SyncEngine {
public:
  struct Options {
    // Upper bound for a single read of file content from the channel.
    std::size_t receive_buffer_size = 104857600;
    // Pause between two client rounds.
    std::chrono::milliseconds round_interval{1000};
  };

  struct Stats {
    std::size_t rounds = 0;
    std::size_t files_sent = 0;
    std::size_t files_received = 0;
    std::size_t files_rejected = 0;
    std::size_t resumes = 0;
  };

  SyncEngine(PeerLink& link,
             Recorder& recorder,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);

  // Never returns under network failure; local errors propagate.
  void run();

  // One role-appropriate iteration. A broken channel is handed to
  // PeerLink::resume() before returning.
  void step();

  // Server side: wait for one command byte and act on it.
  void serve_command();
  // Client side: pull the peer's batch, then push ours.
  void run_client_round();

  // Emits a frame for every unsent file, then the terminator.
  void send_files(ByteChannel& channel);
  // Reads frames until the terminator. Returns false when the stream
  // ended before a complete header; the command loop treats that as a
  // broken channel.
  bool receive_files(ByteChannel& channel);

  const Stats& stats() const { return stats_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  bool send_file(ByteChannel& channel, const std::string& path);
  void stream_file(ByteChannel& channel, const std::string& path, uint32_t size);
  void receive_file(ByteChannel& channel, const std::string& path, uint32_t size);
  void discard(ByteChannel& channel, uint32_t size);
  std::size_t chunk_size(std::size_t remaining) const;

  PeerLink& link_;
  Recorder& recorder_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::vector<char> buffer_;
  Stats stats_;
};
