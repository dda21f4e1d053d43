#pragma once

#include <string_view>

#include "efb/core/types.hpp"

namespace efb::emoji {

inline constexpr std::string_view kGroupEmoji = "\U0001F465";
inline constexpr std::string_view kUserEmoji = "\U0001F464";
inline constexpr std::string_view kSystemEmoji = "\U0001F4BB";
inline constexpr std::string_view kUnknownEmoji = "\u2753";
inline constexpr std::string_view kLinkEmoji = "\U0001F517";

/// Returns the symbol shown next to a message source of the given chat type.
/// Values outside User, Group and System map to kUnknownEmoji.
[[nodiscard]] auto source_emoji(ChatType type) noexcept -> std::string_view;

} // namespace efb::emoji
