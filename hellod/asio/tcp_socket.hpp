#ifndef HELLOD_ASIO_TCP_SOCKET_HPP
#define HELLOD_ASIO_TCP_SOCKET_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/noncopyable.hpp>

#include "../util/types.hpp"

namespace hellod::asio {

/**
 * Accepted TCP connection. Reads and writes never throw: transport errors are
 * logged and reported as zero bytes transferred, and the caller drops the
 * connection.
 */
class tcp_socket : private boost::noncopyable {
public:
    explicit tcp_socket(boost::asio::io_context& io_context);
    ~tcp_socket();

    // bytes read, 0 on error or end of stream
    awaitable<size_t> read_some(uint8_t* buffer, size_t max_size);

    // bytes written, 0 on error
    awaitable<size_t> write(const std::vector<boost::asio::const_buffer>& buffers);

    // shutdown and close, safe to call more than once
    void close();

    bool is_open() const { return socket_.is_open(); }

    // peer address, "0.0.0.0" when not connected
    std::string get_remote_ip() const;

    boost::asio::ip::tcp::socket& get_socket() { return socket_; }

private:
    boost::asio::ip::tcp::socket socket_;
};

}

#endif
