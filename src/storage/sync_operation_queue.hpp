#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <optional>
#include <vector>

namespace ladle::storage {

/**
 * Counts of sync operations by status.
 */
struct QueueStats {
    int queued{0};
    int in_progress{0};
    int completed{0};
    int failed{0};
    
    [[nodiscard]] int pending() const noexcept { return queued + in_progress + failed; }
    bool operator==(const QueueStats&) const = default;
};

/**
 * SyncOperationQueue - Durable log of local changes awaiting propagation.
 *
 * There is at most one row per (kind, entity, op). Enqueueing an op that
 * already has a row resets it to queued with zero attempts, so repeated
 * edits collapse into one pending update.
 *
 * Status transitions:
 *   queued -> in_progress -> completed
 *                         -> failed -> in_progress ...
 */
class SyncOperationQueue {
public:
    explicit SyncOperationQueue(Database& db) : db_(db) {}
    
    /** Append (or reset) an operation. Returns the row id. */
    [[nodiscard]] Result<int64_t, Error> enqueue(
        EntityKind kind, const Uuid& entity_id, OpKind op, Timestamp now = Timestamp::now());
    
    [[nodiscard]] Result<std::optional<SyncOperation>, Error> get(int64_t op_id);
    
    /** Move to in_progress and count the attempt. */
    [[nodiscard]] Result<void, Error> mark_in_progress(int64_t op_id, Timestamp now = Timestamp::now());
    [[nodiscard]] Result<void, Error> mark_completed(int64_t op_id, Timestamp now = Timestamp::now());
    [[nodiscard]] Result<void, Error> mark_failed(
        int64_t op_id, const std::string& error, Timestamp now = Timestamp::now());
    
    // Same transitions applied to every non-completed op of one entity.
    [[nodiscard]] Result<int, Error> start_for_entity(
        EntityKind kind, const Uuid& entity_id, Timestamp now = Timestamp::now());
    /**
     * Complete the entity's in_progress ops only. A row re-enqueued after
     * the push started is queued again and stays pending.
     */
    [[nodiscard]] Result<int, Error> complete_for_entity(
        EntityKind kind, const Uuid& entity_id, Timestamp now = Timestamp::now());
    [[nodiscard]] Result<int, Error> fail_for_entity(
        EntityKind kind, const Uuid& entity_id, const std::string& error,
        Timestamp now = Timestamp::now());
    
    /** All operations, oldest first, optionally filtered by status. */
    [[nodiscard]] Result<std::vector<SyncOperation>, Error> list(
        std::optional<OpStatus> status = std::nullopt);
    
    /** Non-completed operations for one entity kind, oldest first. */
    [[nodiscard]] Result<std::vector<SyncOperation>, Error> pending_for_kind(EntityKind kind);
    
    /** Non-completed operations for one entity, oldest first. */
    [[nodiscard]] Result<std::vector<SyncOperation>, Error> pending_for_entity(
        EntityKind kind, const Uuid& entity_id);
    
    /** Drop every operation for an entity. Returns the number removed. */
    [[nodiscard]] Result<int, Error> remove_for_entity(const Uuid& entity_id);
    
    /** Drop completed operations last touched before `before`. */
    [[nodiscard]] Result<int, Error> purge_completed(Timestamp before);
    
    [[nodiscard]] Result<QueueStats, Error> stats();

private:
    Database& db_;
    
    [[nodiscard]] Result<void, Error> expect_one(Result<int, Error> changed, int64_t op_id);
};

} // namespace ladle::storage
