#include "efb/core/config.hpp"
#include "efb/core/logger.hpp"
#include "efb/infra/paths.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace efb {

auto load_config(const std::filesystem::path& path, const Config& base) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, keeping current settings", path.string());
        return base;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, keeping current settings", path.string());
        return base;
    }

    try {
        auto overrides = json::parse(file);
        if (!overrides.is_object()) {
            LOG_ERROR("Config file {} must hold a JSON object", path.string());
            return base;
        }

        json merged = base;
        merged.update(overrides);
        auto config = merged.get<Config>();
        if (overrides.contains("data_root") && config.data_root) {
            config.data_root = resolve_env_refs(*config.data_root);
        }
        if (overrides.contains("cache_root") && config.cache_root) {
            config.cache_root = resolve_env_refs(*config.cache_root);
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return base;
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("EFB_PROFILE"); val && *val) {
        config.profile = val;
    }
    if (auto* val = std::getenv("EFB_LOG_LEVEL"); val && *val) {
        config.log_level = val;
    }
    if (auto* val = std::getenv(std::string(infra::kDataPathEnv).c_str()); val && *val) {
        config.data_root = val;
    }
    if (auto* val = std::getenv(std::string(infra::kCachePathEnv).c_str()); val && *val) {
        config.cache_root = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto apply_environment(const Config& config) -> VoidResult {
    auto export_var = [](std::string_view name, const std::optional<std::string>& value)
        -> VoidResult {
        if (!value) return {};
        if (::setenv(std::string(name).c_str(), value->c_str(), 1) != 0) {
            return std::unexpected(make_error(
                ErrorCode::InternalError, "Failed to set environment variable",
                std::string(name), std::error_code(errno, std::generic_category())));
        }
        LOG_DEBUG("Config: {}={}", name, *value);
        return {};
    };

    if (auto r = export_var(infra::kDataPathEnv, config.data_root); !r) return r;
    return export_var(infra::kCachePathEnv, config.cache_root);
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        auto rest = input.substr(i);

        // $${VAR} -> literal ${VAR}
        if (rest.starts_with("$${")) {
            result += "${";
            i += 3;
            continue;
        }

        if (rest.starts_with("${")) {
            auto close = rest.find('}');
            if (close != std::string_view::npos) {
                std::string var_name(rest.substr(2, close - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Unresolved refs are kept verbatim
                    result += rest.substr(0, close + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i += close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace efb
