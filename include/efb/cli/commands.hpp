#pragma once

#include <filesystem>
#include <functional>
#include <string>

#include <CLI/CLI.hpp>

#include "efb/core/error.hpp"

namespace efb::cli {

/// Deferred subcommand body; runs once configuration is in place.
using Command = std::function<int()>;

/// Values bound to subcommand arguments.
struct CommandOptions {
    std::string channel;
    std::string ext = "yaml";
};

/// Register `base`, `data`, `config`, `cache` and `plugins`.
/// Each prints one resolved path.
void register_path_commands(CLI::App& app, CommandOptions& options, Command& selected);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

/// Prints a resolved path to stdout, or the error to stderr.
/// @returns 0 on success, 1 on failure.
auto print_path(const Result<std::filesystem::path>& path) -> int;

} // namespace efb::cli
