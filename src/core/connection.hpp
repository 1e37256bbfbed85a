#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace ladle {

enum class ConnectionStatus {
    Pending,
    Accepted
};

[[nodiscard]] inline std::string to_string(ConnectionStatus s) {
    return s == ConnectionStatus::Accepted ? "accepted" : "pending";
}

// Legacy "rejected" / "blocked" rows decode as pending.
[[nodiscard]] inline ConnectionStatus connection_status_from_string(std::string_view s) {
    return s == "accepted" ? ConnectionStatus::Accepted : ConnectionStatus::Pending;
}

/**
 * Connection - A friend request or friendship between two users.
 */
struct Connection {
    Uuid id;
    Uuid from_user_id;
    Uuid to_user_id;
    ConnectionStatus status{ConnectionStatus::Pending};
    std::optional<std::string> from_username;
    std::optional<std::string> from_display_name;
    std::optional<std::string> to_username;
    std::optional<std::string> to_display_name;
    Timestamp created_at;
    Timestamp updated_at;
    
    bool operator==(const Connection&) const = default;
};

[[nodiscard]] inline Connection create_connection_request(Uuid id, Uuid from_user_id, Uuid to_user_id) {
    auto now = Timestamp::now();
    return Connection{
        .id = id,
        .from_user_id = from_user_id,
        .to_user_id = to_user_id,
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Connection accepted(Connection c) {
    c.status = ConnectionStatus::Accepted;
    c.updated_at = Timestamp::now();
    return c;
}

[[nodiscard]] inline bool involves(const Connection& c, const Uuid& user_id) {
    return c.from_user_id == user_id || c.to_user_id == user_id;
}

} // namespace ladle
