#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "efb/cli/commands.hpp"
#include "efb/core/config.hpp"

namespace efb::cli {

/// The `efb-paths` command line tool.
///
/// Parses arguments with CLI11, layers the configuration (environment, then
/// the config file, then flags), publishes the profile and data roots, and
/// runs the selected subcommand.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string profile_;
    std::string log_level_;
    CommandOptions options_;
    Command command_;
};

} // namespace efb::cli
