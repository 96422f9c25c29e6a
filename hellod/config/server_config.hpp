#ifndef HELLOD_CONFIG_SERVER_CONFIG_HPP
#define HELLOD_CONFIG_SERVER_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hellod::config {

// Environment lookup, returns nullptr when the variable is not set
using env_lookup = std::function<const char*(const char*)>;

/**
 * Process configuration. It is read once at startup from the environment and
 * passed by value to the components that need it, so nothing reads the
 * environment at request time.
 */
struct server_config {
    static constexpr const char* ENV_HOST = "HOST";
    static constexpr const char* ENV_PORT = "PORT";
    static constexpr const char* ENV_DEBUG = "DEBUG";
    static constexpr const char* ENV_LOG_REQUESTS = "LOG_REQUESTS";

    static constexpr const char* DEFAULT_HOST = "localhost";
    static constexpr uint16_t DEFAULT_PORT = 3000;
    static constexpr bool DEFAULT_DEBUG = false;
    static constexpr bool DEFAULT_LOG_REQUESTS = true;

    std::string host = DEFAULT_HOST;
    uint16_t port = DEFAULT_PORT;
    bool debug = DEFAULT_DEBUG;
    bool log_requests = DEFAULT_LOG_REQUESTS;

    /// build the configuration from the process environment, a .env file in the
    /// working directory or a near parent fills variables the process lacks
    static server_config from_environment();

    /// build the configuration from the given lookup, invalid values fall back to defaults
    static server_config from_environment(const env_lookup& lookup);

    /// bind address as host:port
    std::string bind_address() const;

    /// configuration summary, used for the startup log
    nlohmann::json to_json() const;

    bool operator==(const server_config& other) const = default;
};

// value parsers, empty optional when the value is not valid
std::optional<uint16_t> parse_port(const std::string& value);
std::optional<bool> parse_bool(const std::string& value);

}

#endif
