#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace ladle {

/**
 * User - A profile. Profiles are discoverable, so they are always copied
 * to the public partition.
 */
struct User {
    Uuid id;
    std::string username;
    std::string display_name;
    std::optional<std::string> email;
    std::optional<std::string> profile_emoji;
    std::optional<std::string> profile_color;
    std::optional<std::string> profile_image_filename;
    Timestamp created_at;
    Timestamp updated_at;
    
    bool operator==(const User&) const = default;
};

[[nodiscard]] inline User create_user(Uuid id, std::string username, std::string display_name) {
    auto now = Timestamp::now();
    return User{
        .id = id,
        .username = std::move(username),
        .display_name = std::move(display_name),
        .created_at = now,
        .updated_at = now
    };
}

} // namespace ladle
