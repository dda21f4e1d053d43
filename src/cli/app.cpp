#include "efb/cli/app.hpp"
#include "efb/core/coordinator.hpp"
#include "efb/core/logger.hpp"

#include <filesystem>
#include <iostream>

#ifndef EFB_VERSION_STRING
#define EFB_VERSION_STRING "0.1.0-dev"
#endif

namespace efb::cli {

App::App()
    : cli_("efb-paths", "Resolve EH Forwarder Bot data, config, cache and plugin directories")
    , config_(load_config_from_env())
{
    cli_.set_version_flag("--version", EFB_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("EFB_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("-p,--profile", profile_,
                    "Profile to resolve paths for (default: from config)");

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    if (!config_path_.empty()) {
        config_ = load_config(std::filesystem::path(config_path_), config_);
    }
    if (!profile_.empty()) config_.profile = profile_;
    if (!log_level_.empty()) config_.log_level = log_level_;

    Logger::init("efb", config_.log_level);
    LOG_DEBUG("Using profile {}", config_.profile);

    coordinator().set_profile(config_.profile);
    if (auto applied = apply_environment(config_); !applied) {
        std::cerr << "error: " << applied.error().what() << "\n";
        return 1;
    }

    // Version and other immediate subcommands leave no deferred command.
    if (!command_) {
        return 0;
    }
    auto code = command_();
    Logger::flush();
    return code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_path_commands(cli_, options_, command_);
    register_version_command(cli_);
}

} // namespace efb::cli
