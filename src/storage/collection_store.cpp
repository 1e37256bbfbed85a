#include "storage/collection_store.hpp"
#include "storage/json_columns.hpp"
#include "storage/rows.hpp"

namespace ladle::storage {

namespace {

constexpr const char* kSelectCollection = R"SQL(
    SELECT id, name, description, user_id, recipe_ids_json, visibility,
           emoji, color, cover_image_filename, created_at, updated_at
    FROM collections )SQL";

} // namespace

Result<Collection, Error> CollectionStore::row_to_collection(const Statement& stmt) {
    auto id = column_uuid(stmt, 0);
    if (id.is_err()) return Result<Collection, Error>::err(id.unwrap_err());
    auto user_id = column_uuid(stmt, 3);
    if (user_id.is_err()) return Result<Collection, Error>::err(user_id.unwrap_err());
    auto recipe_ids = decode_uuid_list(stmt.column_text(4));
    if (recipe_ids.is_err()) return Result<Collection, Error>::err(recipe_ids.unwrap_err());
    
    return Result<Collection, Error>::ok(Collection{
        .id = id.unwrap(),
        .name = stmt.column_text(1),
        .description = stmt.column_text(2),
        .user_id = user_id.unwrap(),
        .recipe_ids = std::move(recipe_ids).unwrap(),
        .visibility = visibility_from_string(stmt.column_text(5)),
        .emoji = stmt.column_optional_text(6),
        .color = stmt.column_optional_text(7),
        .cover_image_filename = stmt.column_optional_text(8),
        .created_at = Timestamp(stmt.column_int64(9)),
        .updated_at = Timestamp(stmt.column_int64(10))
    });
}

Result<std::optional<Collection>, Error> CollectionStore::get(const Uuid& id) {
    return select_one<Collection>(db_, std::string(kSelectCollection) + "WHERE id = ?;",
                                  row_to_collection, id.to_string());
}

Result<std::vector<Collection>, Error> CollectionStore::list_all() {
    return select_rows<Collection>(
        db_, std::string(kSelectCollection) + "ORDER BY updated_at DESC;", row_to_collection);
}

Result<std::vector<Collection>, Error> CollectionStore::list_by_user(const Uuid& user_id) {
    return select_rows<Collection>(
        db_, std::string(kSelectCollection) + "WHERE user_id = ? ORDER BY updated_at DESC;",
        row_to_collection, user_id.to_string());
}

Result<std::vector<Collection>, Error> CollectionStore::list_containing(const Uuid& recipe_id) {
    // Ids are fixed-width hex, so a quoted substring match is exact.
    return select_rows<Collection>(
        db_, std::string(kSelectCollection) + "WHERE recipe_ids_json LIKE ? ORDER BY updated_at DESC;",
        row_to_collection, "%\"" + recipe_id.to_string() + "\"%");
}

Result<void, Error> CollectionStore::save(const Collection& collection) {
    auto result = db_.run(R"SQL(
        INSERT INTO collections (id, name, description, user_id, recipe_ids_json, visibility,
                                 emoji, color, cover_image_filename, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            description = excluded.description,
            user_id = excluded.user_id,
            recipe_ids_json = excluded.recipe_ids_json,
            visibility = excluded.visibility,
            emoji = excluded.emoji,
            color = excluded.color,
            cover_image_filename = excluded.cover_image_filename,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at;
    )SQL",
        collection.id.to_string(),
        collection.name,
        collection.description,
        collection.user_id.to_string(),
        encode_uuid_list(collection.recipe_ids),
        to_string(collection.visibility),
        collection.emoji,
        collection.color,
        collection.cover_image_filename,
        collection.created_at.millis(),
        collection.updated_at.millis());
    
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> CollectionStore::remove(const Uuid& id) {
    return db_.run("DELETE FROM collections WHERE id = ?;", id.to_string())
        .map([](int changed) { return changed > 0; });
}

} // namespace ladle::storage
