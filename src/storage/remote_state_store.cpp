#include "storage/remote_state_store.hpp"
#include "storage/rows.hpp"

namespace ladle::storage {

namespace {

constexpr const char* kSelectState = R"SQL(
    SELECT entity_kind, entity_id, remote_record_id, public_record_id,
           remote_asset_record_id, remote_asset_modified_at, public_asset_modified_at,
           last_synced_at
    FROM remote_sync_state )SQL";

Result<RemoteSyncState, Error> row_to_state(const Statement& stmt) {
    auto kind = entity_kind_from_string(stmt.column_text(0));
    if (!kind) {
        return Result<RemoteSyncState, Error>::err(
            Error{ErrorKind::InvalidData, "Unknown entity kind: " + stmt.column_text(0)});
    }
    auto id = column_uuid(stmt, 1);
    if (id.is_err()) return Result<RemoteSyncState, Error>::err(id.unwrap_err());
    
    return Result<RemoteSyncState, Error>::ok(RemoteSyncState{
        .entity_kind = *kind,
        .entity_id = id.unwrap(),
        .remote_record_id = stmt.column_optional_text(2),
        .public_record_id = stmt.column_optional_text(3),
        .remote_asset_record_id = stmt.column_optional_text(4),
        .remote_asset_modified_at = column_optional_timestamp(stmt, 5),
        .public_asset_modified_at = column_optional_timestamp(stmt, 6),
        .last_synced_at = column_optional_timestamp(stmt, 7)
    });
}

} // namespace

Result<std::optional<RemoteSyncState>, Error> RemoteStateStore::get(EntityKind kind, const Uuid& entity_id) {
    return select_one<RemoteSyncState>(
        db_, std::string(kSelectState) + "WHERE entity_kind = ? AND entity_id = ?;",
        row_to_state, to_string(kind), entity_id.to_string());
}

Result<RemoteSyncState, Error> RemoteStateStore::get_or_default(EntityKind kind, const Uuid& entity_id) {
    return get(kind, entity_id).map([&](const std::optional<RemoteSyncState>& state) {
        if (state) return *state;
        return RemoteSyncState{.entity_kind = kind, .entity_id = entity_id};
    });
}

Result<std::vector<RemoteSyncState>, Error> RemoteStateStore::list(EntityKind kind) {
    return select_rows<RemoteSyncState>(
        db_, std::string(kSelectState) + "WHERE entity_kind = ?;", row_to_state, to_string(kind));
}

Result<void, Error> RemoteStateStore::save(const RemoteSyncState& state) {
    auto result = db_.run(R"SQL(
        INSERT INTO remote_sync_state (entity_kind, entity_id, remote_record_id, public_record_id,
                                       remote_asset_record_id, remote_asset_modified_at,
                                       public_asset_modified_at, last_synced_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(entity_kind, entity_id) DO UPDATE SET
            remote_record_id = excluded.remote_record_id,
            public_record_id = excluded.public_record_id,
            remote_asset_record_id = excluded.remote_asset_record_id,
            remote_asset_modified_at = excluded.remote_asset_modified_at,
            public_asset_modified_at = excluded.public_asset_modified_at,
            last_synced_at = excluded.last_synced_at;
    )SQL",
        to_string(state.entity_kind),
        state.entity_id.to_string(),
        state.remote_record_id,
        state.public_record_id,
        state.remote_asset_record_id,
        optional_millis(state.remote_asset_modified_at),
        optional_millis(state.public_asset_modified_at),
        optional_millis(state.last_synced_at));
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> RemoteStateStore::remove(EntityKind kind, const Uuid& entity_id) {
    return db_.run("DELETE FROM remote_sync_state WHERE entity_kind = ? AND entity_id = ?;",
                   to_string(kind), entity_id.to_string())
        .map([](int changed) { return changed > 0; });
}

} // namespace ladle::storage
