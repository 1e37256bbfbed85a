#include "storage/connection_store.hpp"
#include "storage/rows.hpp"

namespace ladle::storage {

namespace {

constexpr const char* kSelectConnection = R"SQL(
    SELECT id, from_user_id, to_user_id, status, from_username, from_display_name,
           to_username, to_display_name, created_at, updated_at
    FROM connections )SQL";

} // namespace

Result<Connection, Error> ConnectionStore::row_to_connection(const Statement& stmt) {
    auto id = column_uuid(stmt, 0);
    if (id.is_err()) return Result<Connection, Error>::err(id.unwrap_err());
    auto from = column_uuid(stmt, 1);
    if (from.is_err()) return Result<Connection, Error>::err(from.unwrap_err());
    auto to = column_uuid(stmt, 2);
    if (to.is_err()) return Result<Connection, Error>::err(to.unwrap_err());
    
    return Result<Connection, Error>::ok(Connection{
        .id = id.unwrap(),
        .from_user_id = from.unwrap(),
        .to_user_id = to.unwrap(),
        .status = connection_status_from_string(stmt.column_text(3)),
        .from_username = stmt.column_optional_text(4),
        .from_display_name = stmt.column_optional_text(5),
        .to_username = stmt.column_optional_text(6),
        .to_display_name = stmt.column_optional_text(7),
        .created_at = Timestamp(stmt.column_int64(8)),
        .updated_at = Timestamp(stmt.column_int64(9))
    });
}

Result<std::optional<Connection>, Error> ConnectionStore::get(const Uuid& id) {
    return select_one<Connection>(db_, std::string(kSelectConnection) + "WHERE id = ?;",
                                  row_to_connection, id.to_string());
}

Result<std::vector<Connection>, Error> ConnectionStore::list_all() {
    return select_rows<Connection>(
        db_, std::string(kSelectConnection) + "ORDER BY updated_at DESC;", row_to_connection);
}

Result<std::vector<Connection>, Error> ConnectionStore::list_for_user(const Uuid& user_id) {
    const auto id = user_id.to_string();
    return select_rows<Connection>(
        db_,
        std::string(kSelectConnection) +
            "WHERE from_user_id = ? OR to_user_id = ? ORDER BY updated_at DESC;",
        row_to_connection, id, id);
}

Result<std::vector<Connection>, Error> ConnectionStore::list_accepted(const Uuid& user_id) {
    const auto id = user_id.to_string();
    return select_rows<Connection>(
        db_,
        std::string(kSelectConnection) +
            "WHERE (from_user_id = ? OR to_user_id = ?) AND status = 'accepted' "
            "ORDER BY updated_at DESC;",
        row_to_connection, id, id);
}

Result<std::vector<Connection>, Error> ConnectionStore::list_sent_requests(const Uuid& user_id) {
    return select_rows<Connection>(
        db_,
        std::string(kSelectConnection) +
            "WHERE from_user_id = ? AND status = 'pending' ORDER BY created_at DESC;",
        row_to_connection, user_id.to_string());
}

Result<std::vector<Connection>, Error> ConnectionStore::list_received_requests(const Uuid& user_id) {
    return select_rows<Connection>(
        db_,
        std::string(kSelectConnection) +
            "WHERE to_user_id = ? AND status = 'pending' ORDER BY created_at DESC;",
        row_to_connection, user_id.to_string());
}

Result<std::optional<Connection>, Error> ConnectionStore::find_between(const Uuid& a, const Uuid& b) {
    const auto first = a.to_string();
    const auto second = b.to_string();
    return select_one<Connection>(
        db_,
        std::string(kSelectConnection) +
            "WHERE (from_user_id = ? AND to_user_id = ?) OR (from_user_id = ? AND to_user_id = ?) "
            "ORDER BY updated_at DESC LIMIT 1;",
        row_to_connection, first, second, second, first);
}

Result<void, Error> ConnectionStore::save(const Connection& connection) {
    auto result = db_.run(R"SQL(
        INSERT INTO connections (id, from_user_id, to_user_id, status, from_username,
                                 from_display_name, to_username, to_display_name,
                                 created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            from_user_id = excluded.from_user_id,
            to_user_id = excluded.to_user_id,
            status = excluded.status,
            from_username = excluded.from_username,
            from_display_name = excluded.from_display_name,
            to_username = excluded.to_username,
            to_display_name = excluded.to_display_name,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at;
    )SQL",
        connection.id.to_string(),
        connection.from_user_id.to_string(),
        connection.to_user_id.to_string(),
        to_string(connection.status),
        connection.from_username,
        connection.from_display_name,
        connection.to_username,
        connection.to_display_name,
        connection.created_at.millis(),
        connection.updated_at.millis());
    
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> ConnectionStore::remove(const Uuid& id) {
    return db_.run("DELETE FROM connections WHERE id = ?;", id.to_string())
        .map([](int changed) { return changed > 0; });
}

} // namespace ladle::storage
