#ifndef HELLOD_LOGGER_HPP
#define HELLOD_LOGGER_HPP
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <memory>

namespace hellod {
    namespace logging {
        inline constexpr const char* LOGGER_NAME = "hellod";

        // process wide logger, null while logging is off
        inline std::shared_ptr<spdlog::logger>& get_logger() {
            static std::shared_ptr<spdlog::logger> instance;
            return instance;
        }

        // route hellod output to another spdlog logger, nullptr silences it
        inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
            get_logger() = std::move(replacement);
        }

        // colored stdout logger at info level, kept if one is already installed
        inline void enable() {
            auto& current = get_logger();
            if (current) return;

            current = spdlog::get(LOGGER_NAME);
            if (!current) {
                current = spdlog::stdout_color_mt(LOGGER_NAME);
            }
            current->set_level(spdlog::level::info);
            current->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%-8l%$] [%t] %v");
        }

        inline void set_log_level(spdlog::level::level_enum level) {
            if (auto current = get_logger()) {
                current->set_level(level);
            }
        }
    }
}

// Skips formatting entirely while no logger is installed
#define HELLOD_LOG_IMPL(level, ...) \
    do { \
        if (auto hellod_logger_ = hellod::logging::get_logger()) { \
            hellod_logger_->log(level, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...)     HELLOD_LOG_IMPL(spdlog::level::info, __VA_ARGS__)
#define LOG_ERROR(...)    HELLOD_LOG_IMPL(spdlog::level::err, __VA_ARGS__)
#define LOG_WARNING(...)  HELLOD_LOG_IMPL(spdlog::level::warn, __VA_ARGS__)
#define LOG_DEBUG(...)    HELLOD_LOG_IMPL(spdlog::level::debug, __VA_ARGS__)
#define LOG_TRACE(...)    HELLOD_LOG_IMPL(spdlog::level::trace, __VA_ARGS__)

#endif
