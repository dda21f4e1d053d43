#include "efb/cli/commands.hpp"
#include "efb/infra/paths.hpp"

#include <iostream>
#include <optional>

#ifndef EFB_VERSION_STRING
#define EFB_VERSION_STRING "0.1.0-dev"
#endif

namespace efb::cli {

auto print_path(const Result<std::filesystem::path>& path) -> int {
    if (!path) {
        std::cerr << "error: " << path.error().what() << "\n";
        return 1;
    }
    std::cout << path->string() << "\n";
    return 0;
}

void register_path_commands(CLI::App& app, CommandOptions& options, Command& selected) {
    auto* base = app.add_subcommand("base", "Print the base data directory");
    base->callback([&selected]() {
        selected = [] { return print_path(infra::base_path()); };
    });

    auto* data = app.add_subcommand("data", "Print the data directory of a channel");
    data->add_option("channel", options.channel, "Channel ID")->required();
    data->callback([&selected, &options]() {
        selected = [&options] { return print_path(infra::data_path(options.channel)); };
    });

    auto* config = app.add_subcommand("config", "Print the path of a configuration file");
    config->add_option("channel", options.channel,
                       "Channel ID (omit for the profile configuration)");
    config->add_option("-e,--ext", options.ext, "Configuration file extension")
        ->default_val("yaml");
    config->callback([&selected, &options]() {
        selected = [&options] {
            std::optional<std::string_view> channel;
            if (!options.channel.empty()) channel = options.channel;
            return print_path(infra::config_path(channel, options.ext));
        };
    });

    auto* cache = app.add_subcommand("cache", "Print the cache directory of a channel");
    cache->add_option("channel", options.channel, "Channel ID")->required();
    cache->callback([&selected, &options]() {
        selected = [&options] { return print_path(infra::cache_path(options.channel)); };
    });

    auto* plugins = app.add_subcommand("plugins", "Print the plugins directory");
    plugins->callback([&selected]() {
        selected = [] { return print_path(infra::plugins_path()); };
    });
}

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "efb-paths " << EFB_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace efb::cli
