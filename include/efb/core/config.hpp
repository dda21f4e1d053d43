#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "efb/core/error.hpp"

// std::optional serializer for nlohmann/json so the NLOHMANN_DEFINE macros
// accept optional members.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace efb {

using json = nlohmann::json;

struct Config {
    std::string profile = "default";
    std::string log_level = "info";
    std::optional<std::string> data_root;   // exported as EFB_DATA_PATH
    std::optional<std::string> cache_root;  // exported as EFB_CACHE_PATH
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, profile, log_level, data_root, cache_root)

/// Loads a JSON config file on top of `base`: only keys present in the file
/// replace values of `base`. A missing or malformed file yields `base`.
/// `${VAR}` references in the root paths are expanded.
auto load_config(const std::filesystem::path& path, const Config& base = Config{}) -> Config;

/// Builds a config from EFB_PROFILE, EFB_LOG_LEVEL, EFB_DATA_PATH and
/// EFB_CACHE_PATH.
auto load_config_from_env() -> Config;

auto default_config() -> Config;

/// Publishes the configured roots to the process environment, where path
/// resolution picks them up on its next call.
auto apply_environment(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// `$${VAR}` is an escape for a literal `${VAR}`; other `$` characters are
/// kept as they are.
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace efb
