#ifndef HELLOD_APP_APPLICATION_HPP
#define HELLOD_APP_APPLICATION_HPP

#include <chrono>
#include <csignal>
#include <set>
#include <boost/asio/signal_set.hpp>
#include "../config/server_config.hpp"
#include "../hello/hello_service.hpp"
#include "../http/server/server_standalone.hpp"

namespace hellod::app {

    /**
     * Process bootstrap. Binds the configured address, serves until one of the
     * stop signals is received and reports how the run ended.
     */
    class application {
    public:
        explicit application(config::server_config config);
        ~application();

        // bind the listening socket, false if the address cannot be used
        bool listen();

        // serve until a stop signal arrives or stop() is called
        void wait(const std::set<int>& signals = {SIGINT, SIGTERM});

        // stop serving, can be called from any thread
        void stop();

        // port actually bound, useful when PORT is 0 in tests
        uint16_t local_port() const;

        http::server& get_server() { return server_; }

    private:
        const config::server_config config_;
        http::server server_;
        hello::hello_service hello_;
        boost::asio::signal_set signals_;
        std::chrono::steady_clock::time_point started_;
    };

    // apply the configuration, serve and return the process exit status
    int run(const config::server_config& config);

}

#endif
