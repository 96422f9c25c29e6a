#include "tcp_socket.hpp"
#include "../util/logger.hpp"

#include <boost/asio/write.hpp>

namespace hellod::asio {

tcp_socket::tcp_socket(boost::asio::io_context& io_context)
    : socket_(io_context) {
}

tcp_socket::~tcp_socket() {
    close();
}

void tcp_socket::close() {
    if (!socket_.is_open()) return;
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        LOG_TRACE("closing tcp socket: {}", ec.message());
    }
}

std::string tcp_socket::get_remote_ip() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? std::string("0.0.0.0") : endpoint.address().to_string();
}

awaitable<size_t> tcp_socket::read_some(uint8_t* buffer, size_t max_size) {
    boost::system::error_code ec;
    auto bytes = co_await socket_.async_read_some(boost::asio::buffer(buffer, max_size),
                                                  redirect_error(use_awaitable, ec));
    if (!ec) co_return bytes;
    if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
        LOG_DEBUG("read from {} failed: {}", get_remote_ip(), ec.message());
    }
    co_return 0;
}

awaitable<size_t> tcp_socket::write(const std::vector<boost::asio::const_buffer>& buffers) {
    boost::system::error_code ec;
    auto bytes = co_await boost::asio::async_write(socket_, buffers, redirect_error(use_awaitable, ec));
    if (!ec) co_return bytes;
    LOG_DEBUG("write to {} failed: {}", get_remote_ip(), ec.message());
    co_return 0;
}

}
