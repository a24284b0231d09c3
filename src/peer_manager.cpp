#include "peer_manager.hpp"

#include <stdexcept>
#include <thread>

const char* to_string(PeerMode mode) {
  switch(mode) {
    case PeerMode::Unconnected: return "unconnected";
    case PeerMode::Client: return "client";
    case PeerMode::Server: return "server";
  }
  return "unknown";
}

const char* to_string(PeerEvent event) {
  switch(event) {
    case PeerEvent::Connected: return "connected";
    case PeerEvent::Accepted: return "accepted";
    case PeerEvent::AttemptFailed: return "attempt-failed";
    case PeerEvent::ResumeFailed: return "resume-failed";
    case PeerEvent::Closed: return "closed";
  }
  return "unknown";
}

PeerMode next_mode(PeerMode current, PeerEvent event) {
  switch(event) {
    case PeerEvent::Connected:
      if(current == PeerMode::Unconnected) return PeerMode::Client;
      break;
    case PeerEvent::Accepted:
      // a client whose server vanished takes over the listening side
      return PeerMode::Server;
    case PeerEvent::AttemptFailed:
      return current;
    case PeerEvent::ResumeFailed:
    case PeerEvent::Closed:
      return PeerMode::Unconnected;
  }
  throw std::logic_error(std::string("illegal peer transition: ") +
                         to_string(current) + " on " + to_string(event));
}

PeerManager::PeerManager(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("peer"))
{
}

PeerManager::~PeerManager(){
  close();
}

void PeerManager::apply(PeerEvent event){
  PeerMode next = next_mode(mode_, event);
  if(next != mode_){
    logger_->debug("mode {} -> {} ({})", to_string(mode_), to_string(next), to_string(event));
  }
  mode_ = next;
}

void PeerManager::start(){
  while(mode_ == PeerMode::Unconnected){
    if(run_as_client()) break;
    if(!run_as_server()) apply(PeerEvent::AttemptFailed);
  }
}

bool PeerManager::run_as_client(){
  logger_->info("Trying to connect to {}:{}", options_.peer_host, options_.port);
  std::error_code ec;
  tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(options_.peer_host, std::to_string(options_.port), ec);
  if(ec){
    logger_->warn("Unable to resolve {}: {}", options_.peer_host, ec.message());
    return false;
  }
  tcp::socket sock(io_);
  asio::connect(sock, endpoints, ec);
  if(ec){
    logger_->info("Peer is not up ({}), running as server", ec.message());
    return false;
  }
  adopt(std::move(sock), PeerEvent::Connected);
  logger_->info("Connected to {}, running as client", channel_->remote_address());
  return true;
}

bool PeerManager::run_as_server(){
  if(!open_acceptor()){
    std::this_thread::sleep_for(options_.retry_delay);
    return false;
  }
  logger_->info("Ready to accept connection on port {}", listen_port());
  tcp::socket sock(io_);
  if(!accept_with_timeout(sock)){
    close_acceptor();
    return false;
  }
  adopt(std::move(sock), PeerEvent::Accepted);
  logger_->info("Accepted connection from {}", channel_->remote_address());
  return true;
}

bool PeerManager::reaccept(){
  if(!acceptor_ || !acceptor_->is_open()) return false;
  logger_->info("Waiting for the peer to reconnect on port {}", listen_port());
  tcp::socket sock(io_);
  std::error_code ec;
  acceptor_->accept(sock, ec);
  if(ec){
    logger_->warn("Accept failed: {}", ec.message());
    return false;
  }
  adopt(std::move(sock), PeerEvent::Accepted);
  logger_->info("Accepted connection from {}", channel_->remote_address());
  return true;
}

void PeerManager::resume(){
  if(channel_){
    channel_->close();
    channel_.reset();
  }

  switch(mode_){
    case PeerMode::Server:
      if(reaccept()) return;
      break;
    case PeerMode::Client:
      logger_->info("Server went away, taking over as server");
      if(run_as_server()) return;
      break;
    case PeerMode::Unconnected:
      break;
  }

  logger_->info("Failed to resume, restarting");
  apply(PeerEvent::ResumeFailed);
  close_acceptor();
  start();
}

ByteChannel& PeerManager::channel(){
  if(!channel_){
    throw std::logic_error("no live channel (mode " + std::string(to_string(mode_)) + ")");
  }
  return *channel_;
}

void PeerManager::close(){
  if(channel_){
    channel_->close();
    channel_.reset();
  }
  close_acceptor();
  apply(PeerEvent::Closed);
}

std::string PeerManager::remote_address() const {
  return channel_ ? channel_->remote_address() : std::string();
}

uint16_t PeerManager::listen_port() const {
  if(!acceptor_ || !acceptor_->is_open()) return 0;
  std::error_code ec;
  auto ep = acceptor_->local_endpoint(ec);
  return ec ? 0 : ep.port();
}

bool PeerManager::open_acceptor(){
  close_acceptor();
  std::error_code ec;
  auto address = asio::ip::make_address(options_.listen_ip, ec);
  if(ec){
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, ec.message());
    return false;
  }
  tcp::endpoint endpoint(address, options_.port);
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  acceptor_->open(endpoint.protocol(), ec);
  if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_->bind(endpoint, ec);
  if(!ec) acceptor_->listen(options_.listen_backlog, ec);
  if(ec){
    logger_->info("Unable to listen on {}:{}: {}", options_.listen_ip, options_.port, ec.message());
    close_acceptor();
    return false;
  }
  return true;
}

void PeerManager::close_acceptor(){
  if(!acceptor_) return;
  std::error_code ec;
  acceptor_->close(ec);
  acceptor_.reset();
}

bool PeerManager::accept_with_timeout(tcp::socket& sock){
  std::error_code result = asio::error::would_block;
  acceptor_->async_accept(sock, [&result](const std::error_code& ec){
    result = ec;
  });

  io_.restart();
  io_.run_for(options_.accept_timeout);
  if(result == asio::error::would_block){
    std::error_code ignored;
    acceptor_->cancel(ignored);
    // let the aborted handler run before `result` goes out of scope
    io_.restart();
    io_.run();
  }

  if(result){
    if(result == asio::error::operation_aborted){
      logger_->info("No peer connected within {} ms", options_.accept_timeout.count());
    } else {
      logger_->info("Accept failed: {}", result.message());
    }
    return false;
  }
  return true;
}

void PeerManager::adopt(tcp::socket sock, PeerEvent event){
  channel_ = std::make_unique<TcpChannel>(std::move(sock));
  apply(event);
}
