#include "server_config.hpp"
#include "env_file.hpp"
#include "../util/logger.hpp"

#include <array>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace hellod::config {

    namespace {
        constexpr std::array<const char*, 6> true_literals{"true", "1", "yes", "on", "enable", "enabled"};
        constexpr std::array<const char*, 6> false_literals{"false", "0", "no", "off", "disable", "disabled"};

        void warn_invalid(const char* variable, const std::string& value, const std::string& fallback) {
            LOG_WARNING("invalid value '{}' for {}, using default: {}", value, variable, fallback);
        }

        bool read_bool(const env_lookup& lookup, const char* variable, bool fallback) {
            const char* raw = lookup(variable);
            if (raw == nullptr) return fallback;
            if (auto value = parse_bool(raw)) return *value;
            warn_invalid(variable, raw, fallback ? "true" : "false");
            return fallback;
        }
    }

    std::optional<uint16_t> parse_port(const std::string& value) {
        auto trimmed = boost::algorithm::trim_copy(value);
        try {
            auto port = boost::lexical_cast<long>(trimmed);
            if (port < 1 || port > 65535) return std::nullopt;
            return static_cast<uint16_t>(port);
        } catch (const boost::bad_lexical_cast&) {
            return std::nullopt;
        }
    }

    std::optional<bool> parse_bool(const std::string& value) {
        auto trimmed = boost::algorithm::trim_copy(value);
        for (const char* literal : true_literals) {
            if (boost::algorithm::iequals(trimmed, literal)) return true;
        }
        for (const char* literal : false_literals) {
            if (boost::algorithm::iequals(trimmed, literal)) return false;
        }
        return std::nullopt;
    }

    server_config server_config::from_environment() {
        env_lookup process_env = [](const char* name) -> const char* {
            return std::getenv(name);
        };

        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (ec) return from_environment(process_env);

        auto dotenv = env_file::find(cwd);
        if (!dotenv) return from_environment(process_env);

        LOG_INFO("loaded {} variables from {}", dotenv->size(), dotenv->get_path().string());
        return from_environment(dotenv->overlay(process_env));
    }

    server_config server_config::from_environment(const env_lookup& lookup) {
        server_config config;

        if (const char* host = lookup(ENV_HOST)) {
            auto trimmed = boost::algorithm::trim_copy(std::string(host));
            if (!trimmed.empty()) {
                config.host = trimmed;
            } else {
                warn_invalid(ENV_HOST, host, DEFAULT_HOST);
            }
        }

        if (const char* port = lookup(ENV_PORT)) {
            if (auto value = parse_port(port)) {
                config.port = *value;
            } else {
                warn_invalid(ENV_PORT, port, std::to_string(DEFAULT_PORT));
            }
        }

        config.debug = read_bool(lookup, ENV_DEBUG, DEFAULT_DEBUG);
        config.log_requests = read_bool(lookup, ENV_LOG_REQUESTS, DEFAULT_LOG_REQUESTS);

        return config;
    }

    std::string server_config::bind_address() const {
        return host + ":" + std::to_string(port);
    }

    nlohmann::json server_config::to_json() const {
        return {
            {"host", host},
            {"port", port},
            {"debug", debug},
            {"log_requests", log_requests}
        };
    }

}
