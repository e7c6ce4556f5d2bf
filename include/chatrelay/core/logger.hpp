#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace chatrelay {

class Logger {
public:
    static void init(std::string_view name = "chatrelay", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace chatrelay

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::chatrelay::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::chatrelay::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::chatrelay::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::chatrelay::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::chatrelay::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::chatrelay::Logger::get(), __VA_ARGS__)
