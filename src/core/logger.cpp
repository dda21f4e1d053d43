#include "efb/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace efb {

namespace {
    constexpr auto kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    std::shared_ptr<spdlog::logger> g_logger;
    spdlog::level::level_enum g_level = spdlog::level::info;

    auto parse_level(std::string_view level) -> spdlog::level::level_enum {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn" || level == "warning") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }
}

void Logger::init(std::string_view name, std::string_view level) {
    g_logger = named(name);
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::named(std::string_view name) -> std::shared_ptr<spdlog::logger> {
    std::string key(name);
    if (auto existing = spdlog::get(key)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(key);
    logger->set_pattern(kPattern);
    logger->set_level(g_level);
    return logger;
}

void Logger::set_level(std::string_view level) {
    g_level = parse_level(level);
    // Named loggers follow the process level.
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(g_level);
    });
}

void Logger::flush() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
    });
}

namespace logging {

namespace {
    void emit(std::string_view name, spdlog::level::level_enum level, std::string_view message) {
        Logger::named(name)->log(level, spdlog::string_view_t(message.data(), message.size()));
    }
}

void critical(std::string_view name, std::string_view message) {
    emit(name, spdlog::level::critical, message);
}

void error(std::string_view name, std::string_view message) {
    emit(name, spdlog::level::err, message);
}

void warning(std::string_view name, std::string_view message) {
    emit(name, spdlog::level::warn, message);
}

void info(std::string_view name, std::string_view message) {
    emit(name, spdlog::level::info, message);
}

void debug(std::string_view name, std::string_view message) {
    emit(name, spdlog::level::debug, message);
}

} // namespace logging

} // namespace efb
