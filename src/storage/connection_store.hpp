#pragma once

#include "storage/database.hpp"
#include "core/connection.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace ladle::storage {

/**
 * ConnectionStore - Data access layer for connections between users.
 */
class ConnectionStore {
public:
    explicit ConnectionStore(Database& db) : db_(db) {}
    
    [[nodiscard]] Result<std::optional<Connection>, Error> get(const Uuid& id);
    
    [[nodiscard]] Result<std::vector<Connection>, Error> list_all();
    
    /** Connections where user_id is either side. */
    [[nodiscard]] Result<std::vector<Connection>, Error> list_for_user(const Uuid& user_id);
    
    [[nodiscard]] Result<std::vector<Connection>, Error> list_accepted(const Uuid& user_id);
    
    /** Pending requests sent by user_id. */
    [[nodiscard]] Result<std::vector<Connection>, Error> list_sent_requests(const Uuid& user_id);
    
    /** Pending requests addressed to user_id. */
    [[nodiscard]] Result<std::vector<Connection>, Error> list_received_requests(const Uuid& user_id);
    
    /** The connection between two users in either direction, if any. */
    [[nodiscard]] Result<std::optional<Connection>, Error> find_between(const Uuid& a, const Uuid& b);
    
    [[nodiscard]] Result<void, Error> save(const Connection& connection);
    
    [[nodiscard]] Result<bool, Error> remove(const Uuid& id);

private:
    Database& db_;
    
    [[nodiscard]] static Result<Connection, Error> row_to_connection(const Statement& stmt);
};

} // namespace ladle::storage
