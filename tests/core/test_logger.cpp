#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/sinks/ostream_sink.h>

#include "efb/core/logger.hpp"

namespace {

/// Attaches a capturing sink to the named logger.
auto capture(const std::string& name, std::ostringstream& out) -> std::shared_ptr<spdlog::logger> {
    auto logger = efb::Logger::named(name);
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("%n|%l|%v");
    logger->sinks().clear();
    logger->sinks().push_back(sink);
    return logger;
}

} // namespace

TEST_CASE("Logger::named returns the same logger for a name", "[core][logger]") {
    auto a = efb::Logger::named("test.same");
    auto b = efb::Logger::named("test.same");
    CHECK(a == b);
    CHECK(a->name() == "test.same");
    CHECK(efb::Logger::named("test.other") != a);
}

TEST_CASE("logging facade routes to the named logger", "[core][logger]") {
    std::ostringstream out;
    capture("test.facade", out);

    efb::logging::info("test.facade", "hello {}", 42);
    efb::logging::warning("test.facade", "careful");
    efb::logging::error("test.facade", "{} failed: {}", "send", "timeout");
    efb::logging::critical("test.facade", "down");

    auto text = out.str();
    CHECK(text.find("test.facade|info|hello 42") != std::string::npos);
    CHECK(text.find("test.facade|warning|careful") != std::string::npos);
    CHECK(text.find("test.facade|error|send failed: timeout") != std::string::npos);
    CHECK(text.find("test.facade|critical|down") != std::string::npos);
}

TEST_CASE("logging facade respects the process level", "[core][logger]") {
    std::ostringstream out;
    capture("test.level", out);

    efb::Logger::set_level("info");
    efb::logging::debug("test.level", "hidden");
    CHECK(out.str().find("hidden") == std::string::npos);

    efb::Logger::set_level("debug");
    efb::logging::debug("test.level", "shown");
    CHECK(out.str().find("test.level|debug|shown") != std::string::npos);

    efb::Logger::set_level("info");
}

TEST_CASE("loggers created later inherit the level", "[core][logger]") {
    efb::Logger::set_level("error");
    auto logger = efb::Logger::named("test.late");
    CHECK(logger->level() == spdlog::level::err);
    efb::Logger::set_level("info");
    CHECK(logger->level() == spdlog::level::info);
}

TEST_CASE("logging facade forwards runtime messages verbatim", "[core][logger]") {
    std::ostringstream out;
    capture("test.runtime", out);

    std::string relayed = "relayed from channel {irc}";
    efb::logging::info("test.runtime", relayed);
    efb::logging::warning("test.runtime", std::string_view(relayed));
    efb::logging::error("test.runtime", relayed + " failed");
    efb::logging::critical("test.runtime", relayed);

    auto text = out.str();
    CHECK(text.find("test.runtime|info|relayed from channel {irc}") != std::string::npos);
    CHECK(text.find("test.runtime|warning|relayed from channel {irc}") != std::string::npos);
    CHECK(text.find("test.runtime|error|relayed from channel {irc} failed") != std::string::npos);
    CHECK(text.find("test.runtime|critical|relayed from channel {irc}") != std::string::npos);

    efb::Logger::set_level("debug");
    efb::logging::debug("test.runtime", relayed);
    CHECK(out.str().find("test.runtime|debug|relayed from channel {irc}") != std::string::npos);
    efb::Logger::set_level("info");
}
