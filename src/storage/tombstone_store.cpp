#include "storage/tombstone_store.hpp"
#include "storage/rows.hpp"

namespace ladle::storage {

namespace {

Result<Tombstone, Error> row_to_tombstone(const Statement& stmt) {
    auto id = column_uuid(stmt, 0);
    if (id.is_err()) return Result<Tombstone, Error>::err(id.unwrap_err());
    
    auto kind = entity_kind_from_string(stmt.column_text(1));
    if (!kind) {
        return Result<Tombstone, Error>::err(
            Error{ErrorKind::InvalidData, "Unknown tombstone kind: " + stmt.column_text(1)});
    }
    
    return Result<Tombstone, Error>::ok(Tombstone{
        .entity_id = id.unwrap(),
        .entity_kind = *kind,
        .deleted_at = Timestamp(stmt.column_int64(2)),
        .remote_record_id = stmt.column_optional_text(3)
    });
}

constexpr const char* kSelectTombstone =
    "SELECT entity_id, entity_kind, deleted_at, remote_record_id FROM tombstones ";

} // namespace

Result<bool, Error> TombstoneStore::mark_deleted(
    EntityKind kind,
    const Uuid& entity_id,
    const std::optional<std::string>& remote_record_id,
    Timestamp deleted_at
) {
    return db_.run(R"SQL(
        INSERT INTO tombstones (entity_id, entity_kind, deleted_at, remote_record_id)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(entity_id) DO NOTHING;
    )SQL",
        entity_id.to_string(), to_string(kind), deleted_at.millis(), remote_record_id)
        .map([](int changed) { return changed > 0; });
}

Result<bool, Error> TombstoneStore::is_deleted(const Uuid& entity_id) {
    auto stmt_result = db_.prepare("SELECT 1 FROM tombstones WHERE entity_id = ? LIMIT 1;");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }
    
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, entity_id.to_string());
    if (bind_result.is_err()) {
        return Result<bool, Error>::err(bind_result.unwrap_err());
    }
    
    return stmt.step();
}

Result<bool, Error> TombstoneStore::unmark(const Uuid& entity_id) {
    return db_.run("DELETE FROM tombstones WHERE entity_id = ?;", entity_id.to_string())
        .map([](int changed) { return changed > 0; });
}

Result<std::optional<Tombstone>, Error> TombstoneStore::get(const Uuid& entity_id) {
    return select_one<Tombstone>(db_, std::string(kSelectTombstone) + "WHERE entity_id = ?;",
                                 row_to_tombstone, entity_id.to_string());
}

Result<std::vector<Tombstone>, Error> TombstoneStore::list() {
    return select_rows<Tombstone>(db_, std::string(kSelectTombstone) + "ORDER BY deleted_at DESC;",
                                  row_to_tombstone);
}

Result<int, Error> TombstoneStore::cleanup(std::chrono::milliseconds retention, Timestamp now) {
    const auto cutoff = now - retention;
    return db_.run("DELETE FROM tombstones WHERE deleted_at < ?;", cutoff.millis());
}

} // namespace ladle::storage
