#include "command_line_parser.hpp"
#include "log.hpp"
#include "peer_manager.hpp"
#include "protocol.hpp"
#include "recorder.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using pairsync::test::FakeLink;
using pairsync::test::MemoryChannel;
using pairsync::test::ScopedWorkspace;
using pairsync::test::read_file;
using pairsync::test::write_file;

struct TestContext {
  pairsync::test::LogCapture& logs;
  bool verbose = false;
};

std::shared_ptr<Logger> make_logger(TestContext& ctx, const std::string& name) {
  auto logger = std::make_shared<Logger>(name);
  ctx.logs.attach(logger, name);
  return logger;
}

Recorder make_recorder(TestContext& ctx) {
  return Recorder("./sync_record.json", "./share", make_logger(ctx, "recorder"));
}

SyncEngine::Options small_buffers() {
  SyncEngine::Options options;
  options.receive_buffer_size = 7; // forces multi-chunk reads
  options.round_interval = std::chrono::milliseconds(0);
  return options;
}

nlohmann::json read_record_file() {
  return nlohmann::json::parse(read_file("./sync_record.json"));
}

std::size_t frame_size(const std::string& path, std::size_t content) {
  return kFrameHeaderSize + path.size() + content;
}

bool expect(bool condition, const std::string& what, TestContext& ctx) {
  if(!condition && ctx.verbose) {
    std::cout << "\n    expectation failed: " << what << "\n";
  }
  return condition;
}

// ---- recorder -------------------------------------------------------------

bool test_new_file_is_unsent(TestContext& ctx) {
  ScopedWorkspace ws("new_file");
  write_file("./share/fresh.txt", "hello");
  auto recorder = make_recorder(ctx);
  return expect(recorder.is_unsent("./share/fresh.txt"), "unrecorded file must be unsent", ctx) &&
         expect(!recorder.is_unsent("./share"), "directories are never unsent", ctx);
}

bool test_mtime_change_marks_unsent(TestContext& ctx) {
  ScopedWorkspace ws("mtime_change");
  const std::string path = "./share/notes.txt";
  write_file(path, "v1");
  auto recorder = make_recorder(ctx);
  recorder.set_ownership(path, true);
  recorder.add_record(path);
  if(!expect(!recorder.is_unsent(path), "recorded file with same mtime is sent", ctx)) return false;

  auto stamp = fs::last_write_time(path);
  fs::last_write_time(path, stamp + std::chrono::seconds(5));
  return expect(recorder.is_unsent(path), "touched file must be unsent again", ctx);
}

bool test_interrupted_transfer_follows_ownership(TestContext& ctx) {
  ScopedWorkspace ws("interrupted_ownership");
  write_file("./share/mine.txt", "sent by me");
  write_file("./share/theirs.txt", "sent to me");
  auto recorder = make_recorder(ctx);
  recorder.set_ownership("./share/mine.txt", true);
  recorder.set_ownership("./share/theirs.txt", false);

  // a restarted process sees the same answer
  auto reloaded = make_recorder(ctx);
  return expect(recorder.is_unsent("./share/mine.txt"), "owner resends", ctx) &&
         expect(!recorder.is_unsent("./share/theirs.txt"), "receiver waits", ctx) &&
         expect(reloaded.is_unsent("./share/mine.txt"), "owner resends after reload", ctx) &&
         expect(!reloaded.is_unsent("./share/theirs.txt"), "receiver waits after reload", ctx);
}

bool test_snapshot_after_each_mutation(TestContext& ctx) {
  ScopedWorkspace ws("snapshots");
  const std::string path = "./share/doc.txt";
  write_file(path, "content");
  auto recorder = make_recorder(ctx);

  recorder.set_ownership(path, true);
  auto first = read_record_file();
  bool ok = expect(first.size() == 1, "one entry after set_ownership", ctx) &&
            expect(first.at(path).at("ownership") == true, "ownership stored", ctx) &&
            expect(!first.at(path).contains("mtime"), "no mtime before completion", ctx);

  recorder.add_record(path);
  auto second = read_record_file();
  ok = ok &&
       expect(second.at(path).at("ownership") == true, "ownership kept", ctx) &&
       expect(second.at(path).at("mtime").get<double>() == file_mtime(path), "mtime stored", ctx) &&
       expect(!fs::exists("./sync_record.json.tmp"), "temporary file renamed away", ctx);

  recorder.delete_record(path);
  recorder.delete_record(path);
  auto third = read_record_file();
  return ok && expect(third.is_object() && third.empty(), "record removed", ctx);
}

bool test_add_record_requires_existing_record(TestContext& ctx) {
  ScopedWorkspace ws("add_requires");
  write_file("./share/orphan.txt", "x");
  auto recorder = make_recorder(ctx);
  try {
    recorder.add_record("./share/orphan.txt");
  } catch(const std::runtime_error&) {
    return expect(!recorder.find("./share/orphan.txt"), "no record created", ctx);
  }
  return false;
}

bool test_corrupt_record_file_starts_empty(TestContext& ctx) {
  ScopedWorkspace ws("corrupt_record");
  write_file("./sync_record.json", "{ not json");
  write_file("./share/a.txt", "a");
  auto recorder = make_recorder(ctx);
  return expect(recorder.size() == 0, "empty mapping", ctx) &&
         expect(recorder.is_unsent("./share/a.txt"), "everything unsent", ctx) &&
         expect(ctx.logs.contains("Ignoring unreadable transfer record"), "warning logged", ctx);
}

bool test_unsent_files_walk_bottom_up(TestContext& ctx) {
  ScopedWorkspace ws("walk_order");
  auto missing = make_recorder(ctx);
  if(!expect(missing.unsent_files().empty(), "missing share dir yields nothing", ctx)) return false;

  write_file("./share/z.txt", "z");
  write_file("./share/a.txt", "a");
  write_file("./share/sub/m.txt", "m");
  write_file("./share/sub/inner/x.txt", "x");
  fs::create_directories("./share/b");

  auto recorder = make_recorder(ctx);
  recorder.set_ownership("./share/z.txt", true);
  recorder.add_record("./share/z.txt");

  std::vector<std::string> expected = {
    "./share/sub/inner/x.txt",
    "./share/sub/m.txt",
    "./share/a.txt"
  };
  return expect(recorder.unsent_files() == expected, "bottom-up order without dirs or synced files", ctx);
}

// ---- wire protocol --------------------------------------------------------

bool test_header_is_big_endian(TestContext& ctx) {
  FrameHeader header;
  header.path_length = 5;
  header.file_size = 0x01020304;
  auto bytes = encode_header(header);
  HeaderBytes expected = {0, 0, 0, 5, 1, 2, 3, 4};
  auto decoded = decode_header(bytes);
  return expect(bytes == expected, "network byte order", ctx) &&
         expect(decoded.path_length == 5 && decoded.file_size == 0x01020304, "decode inverts encode", ctx) &&
         expect(FrameHeader{}.is_terminator(), "zero header terminates", ctx) &&
         expect(!FrameHeader{0, 1}.is_terminator(), "size alone is not a terminator", ctx);
}

bool test_short_header_reads_as_missing(TestContext& ctx) {
  auto channel = MemoryChannel::loopback();
  const unsigned char partial[3] = {0, 0, 0};
  channel->send_all(partial, sizeof(partial));
  channel->close();
  return expect(!read_frame_header(*channel), "three bytes are not a header", ctx);
}

// ---- sync engine ----------------------------------------------------------

bool test_round_trip_between_peers(TestContext& ctx) {
  ScopedWorkspace ws("round_trip");
  const std::string binary("\x00\x01\x02\xff\x00 binary tail", 18);
  const std::string text = "plain text that spans several receive chunks";

  ws.enter("peerA");
  write_file("./share/one.txt", text);
  write_file("./share/docs/two.bin", binary);
  write_file("./share/empty.txt", "");

  auto channel = MemoryChannel::loopback();
  {
    auto recorder = make_recorder(ctx);
    FakeLink link(PeerMode::Client, *channel);
    SyncEngine sender(link, recorder, small_buffers(), make_logger(ctx, "sender"));
    sender.send_files(*channel);
    if(!expect(sender.stats().files_sent == 3, "three files sent", ctx)) return false;
  }
  channel->outbound().close();

  auto wire = channel->inbound().contents();
  std::size_t expected_size = frame_size("./share/docs/two.bin", binary.size()) +
                              frame_size("./share/empty.txt", 0) +
                              frame_size("./share/one.txt", text.size()) +
                              kFrameHeaderSize;
  bool ok = expect(wire.size() == expected_size, "frames plus terminator", ctx) &&
            expect(std::all_of(wire.end() - kFrameHeaderSize, wire.end(),
                               [](unsigned char b){ return b == 0; }), "stream ends with header(0,0)", ctx);

  ws.enter("peerB");
  fs::create_directories("./share");
  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, *channel);
  SyncEngine receiver(link, recorder, small_buffers(), make_logger(ctx, "receiver"));
  ok = ok && expect(receiver.receive_files(*channel), "terminator seen", ctx);

  ok = ok &&
       expect(read_file("./share/one.txt") == text, "text file identical", ctx) &&
       expect(read_file("./share/docs/two.bin") == binary, "binary file identical", ctx) &&
       expect(fs::exists("./share/empty.txt") && fs::file_size("./share/empty.txt") == 0, "empty file created", ctx) &&
       expect(receiver.stats().files_received == 3, "three files received", ctx);

  auto record = recorder.find("./share/one.txt");
  ok = ok && expect(record && !record->ownership && record->mtime, "receiver owns nothing, mtime set", ctx);
  // nothing to echo back: received files match their records
  return ok && expect(recorder.unsent_files().empty(), "no echo of received files", ctx);
}

bool test_receive_stops_at_terminator(TestContext& ctx) {
  ScopedWorkspace ws("terminator");
  auto channel = MemoryChannel::loopback();
  write_terminator(*channel);
  const std::string trailing = "garbage";
  channel->send_all(trailing.data(), trailing.size());

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, *channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "engine"));
  bool saw_terminator = engine.receive_files(*channel);
  return expect(saw_terminator, "terminator reported", ctx) &&
         expect(channel->inbound().available() == trailing.size(), "nothing read past the terminator", ctx) &&
         expect(recorder.size() == 0, "recorder untouched", ctx);
}

bool test_interrupted_send_keeps_in_flight_marker(TestContext& ctx) {
  ScopedWorkspace ws("interrupted_send");
  ws.enter("peerA");
  write_file("./share/a.txt", std::string(100, 'a'));
  write_file("./share/b.txt", std::string(200, 'b'));
  write_file("./share/c.txt", std::string(300, 'c'));

  auto channel = MemoryChannel::loopback();
  // a.txt goes through, b.txt dies one byte into its payload
  channel->set_write_budget(frame_size("./share/a.txt", 100) + frame_size("./share/b.txt", 0) + 1);

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Client, *channel);
  SyncEngine sender(link, recorder, small_buffers(), make_logger(ctx, "sender"));
  bool threw = false;
  try {
    sender.send_files(*channel);
  } catch(const ChannelError&) {
    threw = true;
  }

  auto a = recorder.find("./share/a.txt");
  auto b = recorder.find("./share/b.txt");
  std::vector<std::string> expected_unsent = {"./share/b.txt", "./share/c.txt"};
  bool ok = expect(threw, "channel error surfaced", ctx) &&
            expect(a && a->ownership && a->mtime, "completed file has mtime", ctx) &&
            expect(b && b->ownership && !b->mtime, "in-flight file only has ownership", ctx) &&
            expect(!recorder.find("./share/c.txt"), "untouched file has no record", ctx) &&
            expect(recorder.unsent_files() == expected_unsent, "retry in-flight and pending files", ctx);

  // the receiving side saw a.txt complete and b.txt cut short
  ws.enter("peerB");
  fs::create_directories("./share");
  auto receiver_recorder = make_recorder(ctx);
  SyncEngine receiver(link, receiver_recorder, small_buffers(), make_logger(ctx, "receiver"));
  bool receiver_threw = false;
  try {
    receiver.receive_files(*channel);
  } catch(const ChannelError&) {
    receiver_threw = true;
  }
  auto rb = receiver_recorder.find("./share/b.txt");
  return ok &&
         expect(receiver_threw, "short payload is a channel error", ctx) &&
         expect(read_file("./share/a.txt") == std::string(100, 'a'), "first file intact", ctx) &&
         expect(rb && !rb->ownership && !rb->mtime, "receiver marks partial file", ctx) &&
         expect(!receiver_recorder.is_unsent("./share/b.txt"), "receiver does not push the partial file", ctx);
}

bool test_rejects_paths_outside_share(TestContext& ctx) {
  ScopedWorkspace ws("reject_paths");
  fs::create_directories("./share");
  auto channel = MemoryChannel::loopback();
  auto send_frame = [&](const std::string& path, const std::string& body){
    write_frame_header(*channel, path, static_cast<uint32_t>(body.size()));
    channel->send_all(body.data(), body.size());
  };
  send_frame("../escape.txt", "bad");
  send_frame("./elsewhere/file.txt", "bad");
  send_frame("./share/ok.txt", "good");
  write_terminator(*channel);

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, *channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "engine"));
  bool done = engine.receive_files(*channel);
  return expect(done, "batch completes", ctx) &&
         expect(!fs::exists(ws.root() / ".." / "escape.txt"), "escape not written", ctx) &&
         expect(!fs::exists("./elsewhere"), "foreign directory not created", ctx) &&
         expect(read_file("./share/ok.txt") == "good", "valid frame still received", ctx) &&
         expect(engine.stats().files_rejected == 2, "two frames rejected", ctx) &&
         expect(recorder.size() == 1, "only the valid path recorded", ctx);
}

bool test_receive_creates_only_immediate_parent(TestContext& ctx) {
  ScopedWorkspace ws("immediate_parent");
  fs::create_directories("./share");
  auto channel = MemoryChannel::loopback();
  write_frame_header(*channel, "./share/new/file.txt", 2);
  channel->send_all("ok", 2);
  write_frame_header(*channel, "./share/x/y/deep.txt", 2);
  channel->send_all("no", 2);
  write_terminator(*channel);

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, *channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "engine"));
  bool threw = false;
  try {
    engine.receive_files(*channel);
  } catch(const fs::filesystem_error&) {
    threw = true;
  }
  return expect(read_file("./share/new/file.txt") == "ok", "one level created", ctx) &&
         expect(threw, "missing grandparent is a local error", ctx) &&
         expect(!fs::exists("./share/x"), "no ancestor chain created", ctx);
}

bool test_step_resumes_after_broken_channel(TestContext& ctx) {
  ScopedWorkspace ws("step_resume");
  auto dead = MemoryChannel::loopback();
  dead->close();
  auto live = MemoryChannel::loopback();
  const char command = kCommandYouSend;
  live->send_all(&command, 1);

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, *dead);
  link.on_resume = [&](FakeLink& l){ l.set_channel(*live); };
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "engine"));

  engine.step();
  bool ok = expect(link.resume_calls == 1, "resume requested", ctx) &&
            expect(engine.stats().resumes == 1, "resume counted", ctx) &&
            expect(ctx.logs.contains("Connection broken"), "disconnect logged", ctx);

  engine.step();
  return ok &&
         expect(link.resume_calls == 1, "healthy channel does not resume", ctx) &&
         expect(live->inbound().available() == kFrameHeaderSize, "served an empty batch", ctx);
}

bool test_server_ignores_unknown_command(TestContext& ctx) {
  ScopedWorkspace ws("unknown_command");
  auto channel = MemoryChannel::loopback();
  channel->send_all("x", 1);
  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, *channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "engine"));
  engine.serve_command();
  return expect(channel->inbound().available() == 0, "nothing written back", ctx) &&
         expect(ctx.logs.contains("unknown command"), "warning logged", ctx);
}

bool test_client_round_pulls_then_pushes(TestContext& ctx) {
  ScopedWorkspace ws("client_round");
  write_file("./share/local.txt", "local");

  auto from_server = std::make_shared<pairsync::test::MemoryPipe>();
  auto to_server = std::make_shared<pairsync::test::MemoryPipe>();
  MemoryChannel channel(from_server, to_server);
  auto terminator = encode_header(FrameHeader{});
  from_server->write(terminator.data(), terminator.size());

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Client, channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "client"));
  engine.run_client_round();

  auto wire = to_server->contents();
  const std::string path = "./share/local.txt";
  bool ok = expect(wire.size() == 2 + frame_size(path, 5) + kFrameHeaderSize, "commands, one frame, terminator", ctx) &&
            expect(wire[0] == 's' && wire[1] == 'r', "pull before push", ctx);
  if(!ok) return false;
  std::string sent_path(wire.begin() + 2 + kFrameHeaderSize, wire.begin() + 2 + kFrameHeaderSize + path.size());
  return expect(sent_path == path, "path carries the share prefix", ctx) &&
         expect(engine.stats().rounds == 1, "round counted", ctx);
}

bool test_client_does_not_push_after_cut_batch(TestContext& ctx) {
  ScopedWorkspace ws("cut_batch");
  write_file("./share/a.txt", "never delivered");

  auto from_server = std::make_shared<pairsync::test::MemoryPipe>();
  auto to_server = std::make_shared<pairsync::test::MemoryPipe>();
  from_server->close();
  MemoryChannel channel(from_server, to_server);

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Client, channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "client"));
  engine.step();

  auto wire = to_server->contents();
  return expect(link.resume_calls == 1, "cut batch triggers resume", ctx) &&
         expect(wire.size() == 1 && wire[0] == 's', "only the pull command went out", ctx) &&
         expect(engine.stats().files_sent == 0, "nothing pushed", ctx) &&
         expect(!recorder.find("./share/a.txt"), "no record for the unsent file", ctx) &&
         expect(recorder.is_unsent("./share/a.txt"), "file still pending", ctx);
}

bool test_server_resumes_after_cut_receive(TestContext& ctx) {
  ScopedWorkspace ws("cut_receive");
  fs::create_directories("./share");
  auto channel = MemoryChannel::loopback();
  const char command = kCommandYouReceive;
  channel->send_all(&command, 1);
  const unsigned char partial[5] = {0, 0, 0, 9, 0};
  channel->send_all(partial, sizeof(partial));
  channel->close();

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, *channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "server"));
  engine.step();
  return expect(link.resume_calls == 1, "cut batch triggers resume", ctx) &&
         expect(engine.stats().resumes == 1, "resume counted", ctx);
}

// Truncates `victim` right after the first payload chunk of that size went out.
class ShrinkingChannel : public MemoryChannel {
public:
  ShrinkingChannel(std::shared_ptr<pairsync::test::MemoryPipe> in,
                   std::shared_ptr<pairsync::test::MemoryPipe> out,
                   fs::path victim,
                   std::size_t trigger)
    : MemoryChannel(std::move(in), std::move(out)),
      victim_(std::move(victim)),
      trigger_(trigger) {}

  void send_all(const void* data, std::size_t size) override {
    MemoryChannel::send_all(data, size);
    if(!shrunk_ && size == trigger_) {
      fs::resize_file(victim_, 10);
      shrunk_ = true;
    }
  }

private:
  fs::path victim_;
  std::size_t trigger_;
  bool shrunk_ = false;
};

bool test_shrinking_file_resumes_session(TestContext& ctx) {
  ScopedWorkspace ws("shrinking_file");
  const std::string path = "./share/big.bin";
  write_file(path, std::string(100000, 'z'));

  auto inbound = std::make_shared<pairsync::test::MemoryPipe>();
  auto outbound = std::make_shared<pairsync::test::MemoryPipe>();
  const char command = kCommandYouSend;
  inbound->write(&command, 1);
  ShrinkingChannel channel(inbound, outbound, path, 64 * 1024);

  auto recorder = make_recorder(ctx);
  FakeLink link(PeerMode::Server, channel);
  SyncEngine engine(link, recorder, small_buffers(), make_logger(ctx, "server"));
  engine.step();

  auto record = recorder.find(path);
  return expect(link.resume_calls == 1, "session dropped instead of process", ctx) &&
         expect(ctx.logs.contains("shrank while it was being sent"), "shrink logged", ctx) &&
         expect(record && record->ownership && !record->mtime, "transfer left in flight", ctx) &&
         expect(recorder.is_unsent(path), "file resent next session", ctx);
}

// ---- peer modes -----------------------------------------------------------

bool test_mode_transition_table(TestContext& ctx) {
  const PeerMode modes[] = {PeerMode::Unconnected, PeerMode::Client, PeerMode::Server};
  const PeerEvent events[] = {PeerEvent::Connected, PeerEvent::Accepted, PeerEvent::AttemptFailed,
                              PeerEvent::ResumeFailed, PeerEvent::Closed};
  auto expected = [](PeerMode from, PeerEvent event) -> std::optional<PeerMode> {
    switch(event) {
      case PeerEvent::Connected:
        if(from == PeerMode::Unconnected) return PeerMode::Client;
        return std::nullopt;
      case PeerEvent::Accepted: return PeerMode::Server;
      case PeerEvent::AttemptFailed: return from;
      case PeerEvent::ResumeFailed: return PeerMode::Unconnected;
      case PeerEvent::Closed: return PeerMode::Unconnected;
    }
    return std::nullopt;
  };

  for(auto from : modes) {
    for(auto event : events) {
      auto want = expected(from, event);
      std::optional<PeerMode> got;
      try {
        got = next_mode(from, event);
      } catch(const std::logic_error&) {
        got.reset();
      }
      if(got != want) {
        return expect(false, std::string(to_string(from)) + " on " + to_string(event), ctx);
      }
    }
  }
  return true;
}

// ---- configuration --------------------------------------------------------

bool parse_args(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) {
  std::vector<std::string> storage = args;
  std::vector<char*> argv;
  for(auto& arg : storage) argv.push_back(arg.data());
  CommandLineParser parser("pairsync");
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error);
}

bool test_command_line_and_settings(TestContext& ctx) {
  SettingsManager defaults;
  std::string error;
  bool ok = expect(defaults.get<int>("port") == 23333, "default port", ctx) &&
            expect(defaults.get<int>("receive_buffer_size") == 104857600, "default buffer", ctx) &&
            expect(defaults.get<std::string>("share_dir") == "./share", "default share dir", ctx) &&
            expect(!defaults.validate(error) && error.find("peer_ip") != std::string::npos, "peer_ip required", ctx);

  SettingsManager settings;
  ok = ok && expect(parse_args({"pairsync", "10.0.0.2", "--port", "4000", "-v", "--rbs=4096"}, settings, error),
                    "valid command line", ctx);
  ok = ok &&
       expect(settings.get<std::string>("peer_ip") == "10.0.0.2", "positional peer", ctx) &&
       expect(settings.get<int>("port") == 4000, "port option", ctx) &&
       expect(settings.get<bool>("verbose"), "bare bool flag", ctx) &&
       expect(settings.get<int>("receive_buffer_size") == 4096, "inline alias value", ctx) &&
       expect(settings.validate(error), "validates", ctx);

  SettingsManager by_flag;
  ok = ok && expect(parse_args({"pairsync", "--ip", "192.168.1.9"}, by_flag, error), "--ip form", ctx) &&
       expect(by_flag.get<std::string>("peer_ip") == "192.168.1.9", "--ip value", ctx);

  SettingsManager bad;
  ok = ok &&
       expect(!parse_args({"pairsync", "--bogus", "1"}, bad, error), "unknown option rejected", ctx) &&
       expect(!parse_args({"pairsync", "--port", "abc"}, bad, error), "non-numeric port rejected", ctx) &&
       expect(!parse_args({"pairsync", "a", "b"}, bad, error), "extra positional rejected", ctx);

  SettingsManager out_of_range;
  parse_args({"pairsync", "peer", "--port", "70000"}, out_of_range, error);
  ok = ok && expect(!out_of_range.validate(error), "port range checked", ctx);

  SettingsManager absolute_share;
  parse_args({"pairsync", "peer", "--share", "/srv/share"}, absolute_share, error);
  ok = ok && expect(!absolute_share.validate(error) && error.find("share_dir") != std::string::npos,
                    "absolute share_dir rejected", ctx);
  SettingsManager escaping_share;
  parse_args({"pairsync", "peer", "--share", "./share/../../up"}, escaping_share, error);
  ok = ok && expect(!escaping_share.validate(error), "share_dir with '..' rejected", ctx);
  SettingsManager nested_share;
  parse_args({"pairsync", "peer", "--share", "data/share"}, nested_share, error);
  ok = ok && expect(nested_share.validate(error), "relative share_dir accepted", ctx);

  ScopedWorkspace ws("settings_file");
  SettingsManager saved;
  saved.set_settings_path("./.config/settings.json");
  parse_args({"pairsync", "peer.example", "--share", "./data", "--save"}, saved, error);
  ok = ok && expect(saved.save(), "settings saved", ctx);
  SettingsManager loaded;
  loaded.set_settings_path("./.config/settings.json");
  return ok &&
         expect(loaded.load(), "settings loaded", ctx) &&
         expect(loaded.get<std::string>("share_dir") == "./data", "persistent key restored", ctx) &&
         expect(!loaded.get<bool>("save"), "non-persistent key not restored", ctx);
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("PAIRSYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("PAIRSYNC_TEST_LOGS") != nullptr) || verbose;
  if(!show_logs) {
    set_log_passthrough(false);
  }
  init(true);

  pairsync::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"new_file_is_unsent", test_new_file_is_unsent},
    {"mtime_change_marks_unsent", test_mtime_change_marks_unsent},
    {"interrupted_transfer_follows_ownership", test_interrupted_transfer_follows_ownership},
    {"snapshot_after_each_mutation", test_snapshot_after_each_mutation},
    {"add_record_requires_existing_record", test_add_record_requires_existing_record},
    {"corrupt_record_file_starts_empty", test_corrupt_record_file_starts_empty},
    {"unsent_files_walk_bottom_up", test_unsent_files_walk_bottom_up},
    {"header_is_big_endian", test_header_is_big_endian},
    {"short_header_reads_as_missing", test_short_header_reads_as_missing},
    {"round_trip_between_peers", test_round_trip_between_peers},
    {"receive_stops_at_terminator", test_receive_stops_at_terminator},
    {"interrupted_send_keeps_in_flight_marker", test_interrupted_send_keeps_in_flight_marker},
    {"rejects_paths_outside_share", test_rejects_paths_outside_share},
    {"receive_creates_only_immediate_parent", test_receive_creates_only_immediate_parent},
    {"step_resumes_after_broken_channel", test_step_resumes_after_broken_channel},
    {"server_ignores_unknown_command", test_server_ignores_unknown_command},
    {"client_round_pulls_then_pushes", test_client_round_pulls_then_pushes},
    {"client_does_not_push_after_cut_batch", test_client_does_not_push_after_cut_batch},
    {"server_resumes_after_cut_receive", test_server_resumes_after_cut_receive},
    {"shrinking_file_resumes_session", test_shrinking_file_resumes_session},
    {"mode_transition_table", test_mode_transition_table},
    {"command_line_and_settings", test_command_line_and_settings}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " sync tests: " << std::flush;

  for(const auto& test : tests) {
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
    }
  }
  std::cout << "\n";
  if(!show_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
