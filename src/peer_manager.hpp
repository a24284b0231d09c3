#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "byte_channel.hpp"
#include "connection.hpp"
#include "log.hpp"

enum class PeerMode { Unconnected, Client, Server };

enum class PeerEvent {
  Connected,      // outbound connect succeeded
  Accepted,       // inbound accept succeeded
  AttemptFailed,  // a connect or accept attempt gave up
  ResumeFailed,   // the single resume attempt did not produce a channel
  Closed          // local shutdown
};

const char* to_string(PeerMode mode);
const char* to_string(PeerEvent event);

// The only place mode changes are decided. Throws std::logic_error for a
// transition that cannot happen (e.g. connecting out while already serving).
PeerMode next_mode(PeerMode current, PeerEvent event);

// What the sync loop needs from the connection side.
class PeerLink {
public:
  virtual ~PeerLink() = default;
  virtual PeerMode mode() const = 0;
  // Throws std::logic_error when there is no live channel.
  virtual ByteChannel& channel() = 0;
  // Re-establishes a channel after the current one failed. Returns only
  // once connected again.
  virtual void resume() = 0;
};

// Negotiates the client/server role with the one configured peer and owns
// the resulting TCP channel.
//
// Bootstrap tries to connect out first; when that fails it listens on the
// same port for a bounded time, then starts over. Whoever finds the other
// side listening becomes the client.
class PeerManager : public PeerLink {
public:
    struct Options {
      std::string peer_host;
      uint16_t port = 23333;
      std::string listen_ip = "0.0.0.0";
      std::chrono::milliseconds accept_timeout{5000};
      std::chrono::milliseconds retry_delay{1000};
      int listen_backlog = 2;
    };

    explicit PeerManager(Options options, std::shared_ptr<Logger> logger = nullptr);
    ~PeerManager() override;

    PeerManager(const PeerManager&) = delete;
    PeerManager& operator=(const PeerManager&) = delete;

    // Blocks until a channel exists, in either role.
    void start();

    void resume() override;
    PeerMode mode() const override { return mode_; }
    ByteChannel& channel() override;

    void close();

    std::string remote_address() const;
    // Port of the open listener, 0 when not listening.
    uint16_t listen_port() const;
    const Options& options() const { return options_; }

private:
    using tcp = asio::ip::tcp;

    bool run_as_client();
    bool run_as_server();
    bool reaccept();

    bool open_acceptor();
    void close_acceptor();
    bool accept_with_timeout(tcp::socket& sock);
    void adopt(tcp::socket sock, PeerEvent event);
    void apply(PeerEvent event);

    Options options_;
    asio::io_context io_;
    PeerMode mode_ = PeerMode::Unconnected;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::unique_ptr<TcpChannel> channel_;
    std::shared_ptr<Logger> logger_;
};
