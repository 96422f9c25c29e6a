#ifndef HELLOD_TYPES
#define HELLOD_TYPES

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace hellod {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::redirect_error;

}

#endif
