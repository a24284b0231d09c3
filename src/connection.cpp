#include "connection.hpp"

namespace {

std::string describe_remote(const asio::ip::tcp::socket& sock) {
    std::error_code ec;
    auto ep = sock.remote_endpoint(ec);
    if(ec) return "<unknown>";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

TcpChannel::TcpChannel(asio::ip::tcp::socket sock)
: socket_(std::move(sock)),
  remote_address_(describe_remote(socket_))
{
}

TcpChannel::~TcpChannel(){
    close();
}

void TcpChannel::send_all(const void* data, std::size_t size){
    std::error_code ec;
    asio::write(socket_, asio::buffer(data, size), ec);
    if(ec){
        throw ChannelError("write to " + remote_address_ + " failed: " + ec.message());
    }
}

std::size_t TcpChannel::receive_some(void* buffer, std::size_t size){
    if(size == 0) return 0;
    std::error_code ec;
    std::size_t n = socket_.read_some(asio::buffer(buffer, size), ec);
    if(ec == asio::error::eof) return 0;
    if(ec){
        throw ChannelError("read from " + remote_address_ + " failed: " + ec.message());
    }
    return n;
}

void TcpChannel::close(){
    if(!socket_.is_open()) return;
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}
