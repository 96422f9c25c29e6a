#include "application.hpp"
#include "../util/logger.hpp"

#include <cstdlib>

namespace hellod::app {

    application::application(config::server_config config) :
        config_(std::move(config)),
        hello_(config_),
        signals_(server_.get_io_context())
    {
        server_.set_request_logging(config_.log_requests);
        server_.set_verbose_errors(config_.debug);
        hello_.register_routes(server_);
    }

    application::~application() {
        boost::system::error_code ec;
        signals_.cancel(ec);
    }

    bool application::listen() {
        if (!server_.listen(config_.host, config_.port)) {
            LOG_ERROR("cannot listen on {}:{} ({})", config_.host, config_.port,
                      server_.last_error().message());
            return false;
        }
        hello_.log_endpoints();
        return true;
    }

    void application::wait(const std::set<int>& signals) {
        LOG_DEBUG("registering stop signals...");
        for (auto signal : signals) {
            boost::system::error_code ec;
            signals_.add(signal, ec);
            if (ec) {
                LOG_WARNING("cannot register signal {}: {}", signal, ec.message());
            }
        }

        signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
            if (!ec) {
                LOG_INFO("received signal: {}", signal_number);
                server_.stop();
            }
        });

        started_ = std::chrono::steady_clock::now();
        server_.wait();

        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started_);
        LOG_INFO("server stopped after {}s, requests handled: {}", uptime.count(), server_.requests_handled());
    }

    void application::stop() {
        server_.stop();
    }

    uint16_t application::local_port() const {
        return server_.local_port();
    }

    int run(const config::server_config& config) {
        logging::enable();
        if (config.debug) {
            logging::set_log_level(spdlog::level::debug);
        }

        LOG_INFO("starting hellod with configuration: {}", config.to_json().dump());

        application app(config);
        if (!app.listen()) {
            return EXIT_FAILURE;
        }
        app.wait();
        return EXIT_SUCCESS;
    }

}
