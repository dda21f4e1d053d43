#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace efb {

class Logger {
public:
    static void init(std::string_view name = "efb", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Returns the logger registered under `name`, creating a console logger
    /// with the process pattern and level when none exists yet.
    static auto named(std::string_view name) -> std::shared_ptr<spdlog::logger>;

    static void set_level(std::string_view level);
    static void flush();
};

/// Name-scoped logging facade for channels and plugins. Messages and
/// arguments are passed to the named logger as-is. The single-argument
/// forms take a message built at runtime and log it without formatting.
namespace logging {

void critical(std::string_view name, std::string_view message);
void error(std::string_view name, std::string_view message);
void warning(std::string_view name, std::string_view message);
void info(std::string_view name, std::string_view message);
void debug(std::string_view name, std::string_view message);

template <typename... Args>
void critical(std::string_view name, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Logger::named(name)->critical(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view name, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Logger::named(name)->error(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::string_view name, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Logger::named(name)->warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view name, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Logger::named(name)->info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::string_view name, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Logger::named(name)->debug(fmt, std::forward<Args>(args)...);
}

} // namespace logging

} // namespace efb

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::efb::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::efb::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::efb::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::efb::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::efb::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::efb::Logger::get(), __VA_ARGS__)
