#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "efb/cli/app.hpp"
#include "efb/core/coordinator.hpp"
#include "support/scoped_env.hpp"

namespace fs = std::filesystem;
using efb::test::ScopedEnv;

namespace {

auto run_app(efb::cli::App& app, std::vector<std::string> args) -> int {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return app.run(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("App layers environment, config file and flags", "[cli][app]") {
    auto dir = fs::temp_directory_path() / "efb_test_cli_layering";
    fs::remove_all(dir);
    fs::create_directories(dir);

    auto previous_profile = efb::coordinator().profile();

    ScopedEnv config_env("EFB_CONFIG", std::nullopt);
    ScopedEnv data("EFB_DATA_PATH", (dir / "efb").string());
    ScopedEnv cache("EFB_CACHE_PATH", std::nullopt);
    ScopedEnv user("LOGNAME", "alice");
    ScopedEnv profile("EFB_PROFILE", "work");
    ScopedEnv level("EFB_LOG_LEVEL", std::nullopt);

    SECTION("file without a profile keeps the environment profile") {
        std::ofstream(dir / "efb.json") << R"({ "log_level": "warn" })";

        efb::cli::App app;
        CHECK(run_app(app, {"efb-paths", "-c", (dir / "efb.json").string(), "data", "irc"}) == 0);
        CHECK(app.config().profile == "work");
        CHECK(app.config().log_level == "warn");
        CHECK(efb::coordinator().profile() == "work");
        CHECK(fs::is_directory(dir / "efb" / "alice" / "work" / "irc"));
        CHECK_FALSE(fs::exists(dir / "efb" / "alice" / "default"));
    }

    SECTION("file profile overrides the environment") {
        std::ofstream(dir / "efb.json") << R"({ "profile": "staging" })";

        efb::cli::App app;
        CHECK(run_app(app, {"efb-paths", "-c", (dir / "efb.json").string(), "base"}) == 0);
        CHECK(app.config().profile == "staging");
        CHECK(efb::coordinator().profile() == "staging");
    }

    SECTION("profile flag overrides the file") {
        std::ofstream(dir / "efb.json") << R"({ "profile": "staging" })";

        efb::cli::App app;
        CHECK(run_app(app, {"efb-paths", "-c", (dir / "efb.json").string(),
                            "-p", "night", "config", "irc"}) == 0);
        CHECK(app.config().profile == "night");
        CHECK(fs::is_directory(dir / "efb" / "alice" / "night" / "irc"));
    }

    SECTION("environment alone is used without a file") {
        efb::cli::App app;
        CHECK(run_app(app, {"efb-paths", "plugins"}) == 0);
        CHECK(app.config().profile == "work");
        CHECK(fs::is_directory(dir / "efb" / "alice" / "plugins"));
    }

    efb::coordinator().set_profile(previous_profile);
    fs::remove_all(dir);
}

TEST_CASE("print_path reports failures with exit status 1", "[cli][app]") {
    efb::Result<fs::path> failed = std::unexpected(efb::make_error(
        efb::ErrorCode::IoError, "Failed to create directory", "/nowhere"));
    CHECK(efb::cli::print_path(failed) == 1);
    CHECK(efb::cli::print_path(fs::path("/tmp/efb/")) == 0);
}
