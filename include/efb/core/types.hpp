#pragma once

#include <nlohmann/json.hpp>

namespace efb {

using json = nlohmann::json;

/// Kind of conversation a message originates from.
enum class ChatType {
    User,
    Group,
    System,
    Unknown,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ChatType, {
    {ChatType::Unknown, "Unknown"},
    {ChatType::User, "User"},
    {ChatType::Group, "Group"},
    {ChatType::System, "System"},
})

} // namespace efb
