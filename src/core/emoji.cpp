#include "efb/core/emoji.hpp"

namespace efb::emoji {

auto source_emoji(ChatType type) noexcept -> std::string_view {
    switch (type) {
        case ChatType::User: return kUserEmoji;
        case ChatType::Group: return kGroupEmoji;
        case ChatType::System: return kSystemEmoji;
        default: return kUnknownEmoji;
    }
}

} // namespace efb::emoji
