#include "server_standalone.hpp"
#include "../../util/logger.hpp"

#include <boost/asio/post.hpp>

namespace hellod::http {

server::~server() {
    // nothing runs the io_context anymore, close the acceptor here before
    // the io_context it was created on goes away
    running_ = false;
    shutdown();
}

bool server::listen(const std::string& host, uint16_t port) {
    if (running_) {
        LOG_WARNING("server already listening");
        return false;
    }

    io_context_.restart();
    if (!http_server_base::listen(host, port)) {
        return false;
    }

    work_guard_ = std::make_unique<work_guard_type>(io_context_.get_executor());
    running_ = true;
    return true;
}

void server::wait() {
    LOG_DEBUG("running server io_context");
    io_context_.run();
    LOG_DEBUG("server io_context stopped");
}

bool server::stop() {
    if (!running_.exchange(false)) {
        return false;
    }
    boost::asio::post(io_context_, [this] { shutdown(); });
    return true;
}

void server::shutdown() {
    http_server_base::stop();
    work_guard_.reset();
    io_context_.stop();
}

} // namespace hellod::http
