#include "efb/infra/paths.hpp"
#include "efb/core/logger.hpp"

#include <cstdlib>

#include <sys/types.h>
#include <pwd.h>
#include <unistd.h>

namespace efb::infra {

namespace fs = std::filesystem;

namespace {

auto env_value(std::string_view name) -> std::optional<std::string> {
    if (const auto* value = std::getenv(std::string(name).c_str()); value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace

auto home_dir() -> fs::path {
    if (auto home = env_value("HOME")) {
        return fs::path(*home);
    }
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
    return fs::path("/tmp");
}

auto user_name() -> std::string {
    for (auto var : {"LOGNAME", "USER", "LNAME", "USERNAME"}) {
        if (auto name = env_value(var)) {
            return *name;
        }
    }
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_name) {
        return pw->pw_name;
    }
    // No passwd entry (e.g. an arbitrary uid inside a container).
    return std::to_string(::getuid());
}

auto path_config_from_env() -> PathConfig {
    PathConfig config;
    if (auto root = env_value(kDataPathEnv)) {
        config.data_root = fs::path(*root);
    }
    if (auto root = env_value(kCachePathEnv)) {
        config.cache_root = fs::path(*root);
    }
    config.home = home_dir();
    config.user = user_name();
    return config;
}

auto ensure_dir(const fs::path& path) -> Result<fs::path> {
    auto target = path.has_filename() ? path : path.parent_path();

    std::error_code ec;
    bool created = fs::create_directories(target, ec);
    if (!ec && !fs::is_directory(target, ec) && !ec) {
        // Something other than a directory already sits at this path.
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    if (ec) {
        LOG_ERROR("Failed to create directory {}: {}", path.string(), ec.message());
        return std::unexpected(make_error(
            ErrorCode::IoError, "Failed to create directory", path.string(), ec));
    }
    if (created) {
        LOG_DEBUG("Created directory {}", path.string());
    }
    return path;
}

PathResolver::PathResolver(const ProfileProvider& profile, ConfigSource source)
    : profile_(std::shared_ptr<const ProfileProvider>(), &profile)
    , source_(std::move(source)) {}

PathResolver::PathResolver(std::shared_ptr<const ProfileProvider> profile, ConfigSource source)
    : profile_(std::move(profile)), source_(std::move(source)) {}

auto PathResolver::base_path() const -> Result<fs::path> {
    return base_path(source_());
}

auto PathResolver::base_path(const PathConfig& config) const -> Result<fs::path> {
    fs::path base;
    if (config.data_root) {
        base = *config.data_root / config.user / "";
    } else {
        base = config.home / kDefaultDirName / "";
    }
    return ensure_dir(base);
}

auto PathResolver::profile_path(const PathConfig& config) const -> Result<fs::path> {
    auto base = base_path(config);
    if (!base) {
        return std::unexpected(base.error());
    }
    return ensure_dir(*base / profile_->profile() / "");
}

auto PathResolver::data_path(std::string_view channel_id) const -> Result<fs::path> {
    return data_path(source_(), channel_id);
}

auto PathResolver::data_path(const PathConfig& config, std::string_view channel_id) const
    -> Result<fs::path> {
    auto base = base_path(config);
    if (!base) {
        return std::unexpected(base.error());
    }
    return ensure_dir(*base / profile_->profile() / channel_id / "");
}

auto PathResolver::config_path(std::optional<std::string_view> channel_id,
                               std::string_view ext) const -> Result<fs::path> {
    auto config = source_();
    auto dir = (channel_id && !channel_id->empty())
        ? data_path(config, *channel_id)
        : profile_path(config);
    if (!dir) {
        return std::unexpected(dir.error());
    }
    return *dir / ("config." + std::string(ext));
}

auto PathResolver::cache_path(std::string_view channel_id) const -> Result<fs::path> {
    auto config = source_();
    auto profile = profile_->profile();

    fs::path cache;
    if (config.cache_root) {
        cache = *config.cache_root / config.user / profile / channel_id / "";
    } else {
        cache = config.home / kDefaultDirName / kCacheDirName / profile / channel_id / "";
    }
    return ensure_dir(cache);
}

auto PathResolver::plugins_path() const -> Result<fs::path> {
    auto base = base_path(source_());
    if (!base) {
        return std::unexpected(base.error());
    }
    return ensure_dir(*base / kPluginsDirName / "");
}

auto base_path() -> Result<fs::path> {
    return PathResolver(coordinator()).base_path();
}

auto data_path(std::string_view channel_id) -> Result<fs::path> {
    return PathResolver(coordinator()).data_path(channel_id);
}

auto config_path(std::optional<std::string_view> channel_id, std::string_view ext)
    -> Result<fs::path> {
    return PathResolver(coordinator()).config_path(channel_id, ext);
}

auto cache_path(std::string_view channel_id) -> Result<fs::path> {
    return PathResolver(coordinator()).cache_path(channel_id);
}

auto plugins_path() -> Result<fs::path> {
    return PathResolver(coordinator()).plugins_path();
}

} // namespace efb::infra
