#pragma once
#include <asio.hpp>
#include <string>

#include "byte_channel.hpp"

// Blocking ByteChannel over a connected TCP socket. Every asio error on a
// read or write is rethrown as ChannelError.
class TcpChannel : public ByteChannel {
public:
    explicit TcpChannel(asio::ip::tcp::socket sock);
    ~TcpChannel() override;

    void send_all(const void* data, std::size_t size) override;
    std::size_t receive_some(void* buffer, std::size_t size) override;
    void close() override;

    bool is_open() const { return socket_.is_open(); }
    const std::string& remote_address() const { return remote_address_; }

private:
    asio::ip::tcp::socket socket_;
    std::string remote_address_;
};
