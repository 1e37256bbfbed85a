#include "storage/user_store.hpp"
#include "storage/rows.hpp"

namespace ladle::storage {

namespace {

constexpr const char* kSelectUser = R"SQL(
    SELECT id, username, display_name, email, profile_emoji, profile_color,
           profile_image_filename, created_at, updated_at
    FROM users )SQL";

} // namespace

Result<User, Error> UserStore::row_to_user(const Statement& stmt) {
    auto id = column_uuid(stmt, 0);
    if (id.is_err()) return Result<User, Error>::err(id.unwrap_err());
    
    return Result<User, Error>::ok(User{
        .id = id.unwrap(),
        .username = stmt.column_text(1),
        .display_name = stmt.column_text(2),
        .email = stmt.column_optional_text(3),
        .profile_emoji = stmt.column_optional_text(4),
        .profile_color = stmt.column_optional_text(5),
        .profile_image_filename = stmt.column_optional_text(6),
        .created_at = Timestamp(stmt.column_int64(7)),
        .updated_at = Timestamp(stmt.column_int64(8))
    });
}

Result<std::optional<User>, Error> UserStore::get(const Uuid& id) {
    return select_one<User>(db_, std::string(kSelectUser) + "WHERE id = ?;",
                            row_to_user, id.to_string());
}

Result<std::optional<User>, Error> UserStore::find_by_username(const std::string& username) {
    return select_one<User>(db_, std::string(kSelectUser) + "WHERE username = ? COLLATE NOCASE;",
                            row_to_user, username);
}

Result<std::vector<User>, Error> UserStore::list_all() {
    return select_rows<User>(db_, std::string(kSelectUser) + "ORDER BY username;", row_to_user);
}

Result<void, Error> UserStore::save(const User& user) {
    auto result = db_.run(R"SQL(
        INSERT INTO users (id, username, display_name, email, profile_emoji, profile_color,
                           profile_image_filename, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            username = excluded.username,
            display_name = excluded.display_name,
            email = excluded.email,
            profile_emoji = excluded.profile_emoji,
            profile_color = excluded.profile_color,
            profile_image_filename = excluded.profile_image_filename,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at;
    )SQL",
        user.id.to_string(),
        user.username,
        user.display_name,
        user.email,
        user.profile_emoji,
        user.profile_color,
        user.profile_image_filename,
        user.created_at.millis(),
        user.updated_at.millis());
    
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> UserStore::remove(const Uuid& id) {
    return db_.run("DELETE FROM users WHERE id = ?;", id.to_string())
        .map([](int changed) { return changed > 0; });
}

} // namespace ladle::storage
