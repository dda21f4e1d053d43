#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace efb {

/// Read-only source of the name of the active profile.
class ProfileProvider {
public:
    virtual ~ProfileProvider() = default;

    [[nodiscard]] virtual auto profile() const -> std::string = 0;
};

/// Provider that always reports the same profile.
class FixedProfile : public ProfileProvider {
public:
    explicit FixedProfile(std::string profile) : profile_(std::move(profile)) {}

    [[nodiscard]] auto profile() const -> std::string override { return profile_; }

private:
    std::string profile_;
};

/// Process-wide holder of the current profile. Owned and mutated by the
/// application entry point; everything else only reads it.
class Coordinator : public ProfileProvider {
public:
    static constexpr std::string_view kDefaultProfile = "default";

    Coordinator() = default;

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    [[nodiscard]] auto profile() const -> std::string override { return profile_; }

    void set_profile(std::string profile);

private:
    std::string profile_{kDefaultProfile};
};

/// The coordinator of this process.
auto coordinator() -> Coordinator&;

} // namespace efb
