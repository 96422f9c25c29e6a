#ifndef HELLOD_HTTP_SERVER_STANDALONE_HPP
#define HELLOD_HTTP_SERVER_STANDALONE_HPP

#include "http_server_base.hpp"
#include <atomic>
#include <memory>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace hellod::http {

/**
 * Single-threaded server owning its io_context. The acceptor and every
 * connection run on the thread that calls wait().
 */
class server : public http_server_base {
public:
    server() = default;
    ~server() override;

    bool listen(const std::string& host, uint16_t port) override;

    // run the io_context until stop(), returns at once when nothing is listening
    void wait() override;

    // safe from any thread, the shutdown itself runs on the io_context
    bool stop() override;

    boost::asio::io_context& get_io_context() override { return io_context_; }

private:
    void shutdown();

    using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context io_context_;
    std::unique_ptr<work_guard_type> work_guard_;
    std::atomic<bool> running_{false};
};

} // namespace hellod::http

#endif // HELLOD_HTTP_SERVER_STANDALONE_HPP
