#include "storage/sync_operation_queue.hpp"
#include "storage/rows.hpp"

namespace ladle::storage {

namespace {

constexpr const char* kSelectOperation = R"SQL(
    SELECT id, entity_kind, entity_id, op_kind, status, attempts, last_error,
           created_at, updated_at
    FROM sync_operations )SQL";

Result<SyncOperation, Error> row_to_operation(const Statement& stmt) {
    auto entity_id = column_uuid(stmt, 2);
    if (entity_id.is_err()) return Result<SyncOperation, Error>::err(entity_id.unwrap_err());
    
    auto kind = entity_kind_from_string(stmt.column_text(1));
    auto op = op_kind_from_string(stmt.column_text(3));
    auto status = op_status_from_string(stmt.column_text(4));
    if (!kind || !op || !status) {
        return Result<SyncOperation, Error>::err(Error{
            ErrorKind::InvalidData,
            "Malformed sync operation row " + std::to_string(stmt.column_int64(0))});
    }
    
    return Result<SyncOperation, Error>::ok(SyncOperation{
        .id = stmt.column_int64(0),
        .entity_kind = *kind,
        .entity_id = entity_id.unwrap(),
        .op_kind = *op,
        .status = *status,
        .attempts = stmt.column_int(5),
        .last_error = stmt.column_optional_text(6),
        .created_at = Timestamp(stmt.column_int64(7)),
        .updated_at = Timestamp(stmt.column_int64(8))
    });
}

} // namespace

Result<int64_t, Error> SyncOperationQueue::enqueue(
    EntityKind kind, const Uuid& entity_id, OpKind op, Timestamp now
) {
    auto result = db_.run(R"SQL(
        INSERT INTO sync_operations (entity_kind, entity_id, op_kind, status, attempts,
                                     last_error, created_at, updated_at)
        VALUES (?, ?, ?, 'queued', 0, NULL, ?, ?)
        ON CONFLICT(entity_kind, entity_id, op_kind) DO UPDATE SET
            status = 'queued',
            attempts = 0,
            last_error = NULL,
            updated_at = excluded.updated_at;
    )SQL",
        to_string(kind), entity_id.to_string(), to_string(op), now.millis(), now.millis());
    if (result.is_err()) {
        return Result<int64_t, Error>::err(result.unwrap_err());
    }
    
    // last_insert_rowid() is not reliable for the upsert branch.
    auto stmt_result = db_.prepare(
        "SELECT id FROM sync_operations WHERE entity_kind = ? AND entity_id = ? AND op_kind = ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(to_string(kind), entity_id.to_string(), to_string(op));
    if (bind_result.is_err()) {
        return Result<int64_t, Error>::err(bind_result.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<int64_t, Error>::err(Error{ErrorKind::Storage, "Enqueued operation vanished"});
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<std::optional<SyncOperation>, Error> SyncOperationQueue::get(int64_t op_id) {
    return select_one<SyncOperation>(db_, std::string(kSelectOperation) + "WHERE id = ?;",
                                     row_to_operation, op_id);
}

Result<void, Error> SyncOperationQueue::expect_one(Result<int, Error> changed, int64_t op_id) {
    if (changed.is_err()) {
        return Result<void, Error>::err(changed.unwrap_err());
    }
    if (changed.unwrap() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "No sync operation with id " + std::to_string(op_id)});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SyncOperationQueue::mark_in_progress(int64_t op_id, Timestamp now) {
    return expect_one(db_.run(R"SQL(
        UPDATE sync_operations
        SET status = 'in_progress', attempts = attempts + 1, updated_at = ?
        WHERE id = ?;
    )SQL", now.millis(), op_id), op_id);
}

Result<void, Error> SyncOperationQueue::mark_completed(int64_t op_id, Timestamp now) {
    return expect_one(db_.run(R"SQL(
        UPDATE sync_operations
        SET status = 'completed', last_error = NULL, updated_at = ?
        WHERE id = ?;
    )SQL", now.millis(), op_id), op_id);
}

Result<void, Error> SyncOperationQueue::mark_failed(int64_t op_id, const std::string& error, Timestamp now) {
    return expect_one(db_.run(R"SQL(
        UPDATE sync_operations
        SET status = 'failed', last_error = ?, updated_at = ?
        WHERE id = ?;
    )SQL", error, now.millis(), op_id), op_id);
}

Result<int, Error> SyncOperationQueue::start_for_entity(EntityKind kind, const Uuid& entity_id, Timestamp now) {
    return db_.run(R"SQL(
        UPDATE sync_operations
        SET status = 'in_progress', attempts = attempts + 1, updated_at = ?
        WHERE entity_kind = ? AND entity_id = ? AND status != 'completed';
    )SQL", now.millis(), to_string(kind), entity_id.to_string());
}

Result<int, Error> SyncOperationQueue::complete_for_entity(EntityKind kind, const Uuid& entity_id, Timestamp now) {
    return db_.run(R"SQL(
        UPDATE sync_operations
        SET status = 'completed', last_error = NULL, updated_at = ?
        WHERE entity_kind = ? AND entity_id = ? AND status = 'in_progress';
    )SQL", now.millis(), to_string(kind), entity_id.to_string());
}

Result<int, Error> SyncOperationQueue::fail_for_entity(
    EntityKind kind, const Uuid& entity_id, const std::string& error, Timestamp now
) {
    return db_.run(R"SQL(
        UPDATE sync_operations
        SET status = 'failed', last_error = ?, updated_at = ?
        WHERE entity_kind = ? AND entity_id = ? AND status != 'completed';
    )SQL", error, now.millis(), to_string(kind), entity_id.to_string());
}

Result<std::vector<SyncOperation>, Error> SyncOperationQueue::list(std::optional<OpStatus> status) {
    if (status) {
        return select_rows<SyncOperation>(
            db_, std::string(kSelectOperation) + "WHERE status = ? ORDER BY id ASC;",
            row_to_operation, to_string(*status));
    }
    return select_rows<SyncOperation>(
        db_, std::string(kSelectOperation) + "ORDER BY id ASC;", row_to_operation);
}

Result<std::vector<SyncOperation>, Error> SyncOperationQueue::pending_for_kind(EntityKind kind) {
    return select_rows<SyncOperation>(
        db_,
        std::string(kSelectOperation) +
            "WHERE entity_kind = ? AND status != 'completed' ORDER BY id ASC;",
        row_to_operation, to_string(kind));
}

Result<std::vector<SyncOperation>, Error> SyncOperationQueue::pending_for_entity(
    EntityKind kind, const Uuid& entity_id
) {
    return select_rows<SyncOperation>(
        db_,
        std::string(kSelectOperation) +
            "WHERE entity_kind = ? AND entity_id = ? AND status != 'completed' ORDER BY id ASC;",
        row_to_operation, to_string(kind), entity_id.to_string());
}

Result<int, Error> SyncOperationQueue::remove_for_entity(const Uuid& entity_id) {
    return db_.run("DELETE FROM sync_operations WHERE entity_id = ?;", entity_id.to_string());
}

Result<int, Error> SyncOperationQueue::purge_completed(Timestamp before) {
    return db_.run("DELETE FROM sync_operations WHERE status = 'completed' AND updated_at < ?;",
                   before.millis());
}

Result<QueueStats, Error> SyncOperationQueue::stats() {
    QueueStats stats;
    auto result = db_.query(
        "SELECT status, COUNT(*) FROM sync_operations GROUP BY status;",
        [&stats](const Statement& stmt) {
            const int count = stmt.column_int(1);
            switch (op_status_from_string(stmt.column_text(0)).value_or(OpStatus::Failed)) {
                case OpStatus::Queued: stats.queued += count; break;
                case OpStatus::InProgress: stats.in_progress += count; break;
                case OpStatus::Completed: stats.completed += count; break;
                case OpStatus::Failed: stats.failed += count; break;
            }
        });
    if (result.is_err()) {
        return Result<QueueStats, Error>::err(result.unwrap_err());
    }
    return Result<QueueStats, Error>::ok(stats);
}

} // namespace ladle::storage
