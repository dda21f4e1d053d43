#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "efb/core/coordinator.hpp"
#include "efb/core/error.hpp"

namespace efb::infra {

/// Environment variable overriding the root of the data directory.
inline constexpr std::string_view kDataPathEnv = "EFB_DATA_PATH";

/// Environment variable overriding the root of the cache directory.
inline constexpr std::string_view kCachePathEnv = "EFB_CACHE_PATH";

/// Directory under the home directory used when no override is set.
inline constexpr std::string_view kDefaultDirName = ".ehforwarderbot";

inline constexpr std::string_view kPluginsDirName = "plugins";
inline constexpr std::string_view kCacheDirName = ".cache";
inline constexpr std::string_view kDefaultConfigExt = "yaml";

/// Inputs of path resolution that come from the process environment.
struct PathConfig {
    std::optional<std::filesystem::path> data_root;   // EFB_DATA_PATH
    std::optional<std::filesystem::path> cache_root;  // EFB_CACHE_PATH
    std::filesystem::path home;
    std::string user;
};

/// Returns the user's home directory: $HOME, then the passwd entry, then /tmp.
auto home_dir() -> std::filesystem::path;

/// Returns the login name of the current user. Checks LOGNAME, USER, LNAME
/// and USERNAME in that order before falling back to the passwd entry.
auto user_name() -> std::string;

/// Snapshot of the path-related environment. Empty variables count as unset.
auto path_config_from_env() -> PathConfig;

/// Ensures a directory exists, creating it and parents if necessary.
/// Returns `path` unchanged on success. Fails with IoError when the
/// directory cannot be created or a non-directory occupies the path.
auto ensure_dir(const std::filesystem::path& path) -> Result<std::filesystem::path>;

/// Resolves the directory layout of an installation:
///
///   <base>/
///     plugins/
///     <profile>/
///       config.<ext>
///       <channel>/
///         config.<ext>
///   <cache root>/<user>/<profile>/<channel>/
///
/// The base is `$EFB_DATA_PATH/<user>/` or `~/.ehforwarderbot/`. The cache
/// root defaults to `~/.ehforwarderbot/.cache/` without the user segment.
///
/// The environment and the profile are read again on every call and every
/// directory is created on demand. Returned directories end with a
/// separator. Channel ids and extensions are used verbatim; callers must
/// pass plain path segments.
class PathResolver {
public:
    using ConfigSource = std::function<PathConfig()>;

    /// Borrows `profile`, which must outlive the resolver.
    explicit PathResolver(const ProfileProvider& profile,
                          ConfigSource source = path_config_from_env);

    /// Shares ownership of `profile`.
    explicit PathResolver(std::shared_ptr<const ProfileProvider> profile,
                          ConfigSource source = path_config_from_env);

    // A temporary provider would dangle; pass a shared_ptr instead.
    PathResolver(ProfileProvider&&, ConfigSource = path_config_from_env) = delete;

    [[nodiscard]] auto base_path() const -> Result<std::filesystem::path>;

    [[nodiscard]] auto data_path(std::string_view channel_id) const
        -> Result<std::filesystem::path>;

    /// Path of a configuration file. Only the containing directory is
    /// created; the file itself is never touched. An empty channel id is
    /// treated like no channel id.
    [[nodiscard]] auto config_path(std::optional<std::string_view> channel_id = std::nullopt,
                                   std::string_view ext = kDefaultConfigExt) const
        -> Result<std::filesystem::path>;

    [[nodiscard]] auto cache_path(std::string_view channel_id) const
        -> Result<std::filesystem::path>;

    [[nodiscard]] auto plugins_path() const -> Result<std::filesystem::path>;

private:
    auto base_path(const PathConfig& config) const -> Result<std::filesystem::path>;
    auto profile_path(const PathConfig& config) const -> Result<std::filesystem::path>;
    auto data_path(const PathConfig& config, std::string_view channel_id) const
        -> Result<std::filesystem::path>;

    std::shared_ptr<const ProfileProvider> profile_;
    ConfigSource source_;
};

// Shorthands resolving against the process coordinator and environment.
auto base_path() -> Result<std::filesystem::path>;
auto data_path(std::string_view channel_id) -> Result<std::filesystem::path>;
auto config_path(std::optional<std::string_view> channel_id = std::nullopt,
                 std::string_view ext = kDefaultConfigExt) -> Result<std::filesystem::path>;
auto cache_path(std::string_view channel_id) -> Result<std::filesystem::path>;
auto plugins_path() -> Result<std::filesystem::path>;

} // namespace efb::infra
