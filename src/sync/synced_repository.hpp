#pragma once

#include "core/result.hpp"
#include "core/sync_types.hpp"
#include "core/visibility.hpp"
#include "storage/database.hpp"
#include "sync/image_sync_manager.hpp"
#include "sync/pending_set.hpp"
#include "sync/retry_scheduler.hpp"
#include "sync/sync_context.hpp"
#include <QFuture>
#include <QMutex>
#include <optional>
#include <vector>

namespace ladle::sync {

/**
 * LocalSnapshot - What a push needs to know about the current local entity.
 */
struct LocalSnapshot {
    RemoteRecord record;
    Visibility visibility{Visibility::Private};
    bool replicate_public{false};
    bool has_image{false};
};

/**
 * RemoteQuery - One query issued by a pull.
 */
struct RemoteQuery {
    Partition partition{Partition::Private};
    std::optional<FieldMatch> match;
};

/**
 * PullSummary - What a sync-down pass did.
 */
struct PullSummary {
    int inserted{0};
    int updated{0};
    int pushed{0};
    int unchanged{0};
    int skipped_tombstoned{0};
    int invalid{0};
    int images_downloaded{0};
    int tombstones_cleaned{0};
};

/**
 * SyncedRepository - Propagation machinery shared by the entity repositories.
 *
 * Subclasses own the local phase of create/update/delete and describe their
 * entities through the snapshot hooks. This class owns the background phase:
 * every push re-derives the remote state from what is stored locally at the
 * time it runs, so queued pushes for one id collapse into the latest state.
 *
 * Pushes of one repository run one at a time.
 *
 * Background pushes call the subclass hooks, so every concrete repository
 * calls wait_for_background() from its own destructor.
 */
class SyncedRepository : public RetryParticipant {
public:
    SyncedRepository(EntityKind kind, SyncContext context, ImageSyncManager* images = nullptr);
    ~SyncedRepository() override;
    
    SyncedRepository(const SyncedRepository&) = delete;
    SyncedRepository& operator=(const SyncedRepository&) = delete;
    
    [[nodiscard]] EntityKind kind() const { return kind_; }
    [[nodiscard]] ImageSyncManager* images() const { return images_; }
    [[nodiscard]] PendingSet& pending_sync() { return pending_sync_; }
    [[nodiscard]] const SyncConfig& config() const { return context_.config; }
    
    /**
     * Push id's current local state (or its deletion) to the remote store
     * now, on the calling thread.
     */
    [[nodiscard]] Res<void> push(const Uuid& id);
    
    /**
     * Pull remote records for owner_id and merge them by updated_at.
     * Tombstoned ids are never materialized.
     */
    [[nodiscard]] Res<PullSummary> sync_from_remote(const Uuid& owner_id);
    
    /** Seed the pending sets from queue rows that never completed. Returns the count. */
    [[nodiscard]] Res<int> restore_pending();
    
    /** Block until every background task started so far has finished. */
    void wait_for_background();
    
    [[nodiscard]] Res<RemoteSyncState> remote_state(const Uuid& id);
    
    // RetryParticipant
    [[nodiscard]] QString participant_name() const override;
    [[nodiscard]] size_t pending_count() const override;
    SweepResult retry_pending(const std::atomic_bool& cancelled) override;

protected:
    // Hooks, always called inside LocalStore::with_db().
    
    [[nodiscard]] virtual Res<std::optional<LocalSnapshot>> snapshot(storage::Database& db, const Uuid& id) = 0;
    
    [[nodiscard]] virtual Res<std::optional<Timestamp>> local_updated_at(storage::Database& db, const Uuid& id) = 0;
    
    /** Decode and store a remote record, keeping its timestamps and local-only fields. */
    [[nodiscard]] virtual Res<void> store_remote(storage::Database& db, const RemoteRecord& record) = 0;
    
    [[nodiscard]] virtual std::vector<RemoteQuery> pull_queries(const Uuid& owner_id) const = 0;
    
    // Local-phase helpers for subclasses; the first three run inside a transaction.
    
    [[nodiscard]] Res<void> record_create(storage::Database& db, const Uuid& id);
    [[nodiscard]] Res<void> record_update(storage::Database& db, const Uuid& id);
    [[nodiscard]] Res<void> record_delete(storage::Database& db, const Uuid& id);
    
    /** True when the local image is newer than the last uploaded one. */
    [[nodiscard]] Res<bool> image_needs_upload(storage::Database& db, const Uuid& id);
    
    void after_create(const Uuid& id, bool has_image);
    void after_update(const Uuid& id, Visibility from, Visibility to,
                      bool image_removed, bool image_needs_upload);
    void after_delete(const Uuid& id, bool had_image);
    
    [[nodiscard]] SyncContext& context() { return context_; }

private:
    /** A push whose record went out; the image may still have failed. */
    struct PushOutcome {
        std::optional<Error> upload_error;
    };
    
    [[nodiscard]] Res<PushOutcome> push_locked(const Uuid& id, uint64_t upload_generation);
    [[nodiscard]] Res<PushOutcome> push_existing(const Uuid& id, const LocalSnapshot& snapshot,
                                                 RemoteSyncState& state, uint64_t upload_generation);
    [[nodiscard]] Res<void> push_deletion(const Uuid& id, RemoteSyncState& state);
    [[nodiscard]] Res<void> push_image(const Uuid& id, bool replicate_public, RemoteSyncState& state,
                                       uint64_t upload_generation);
    [[nodiscard]] Res<void> drop_public_copy(const Uuid& id, RemoteSyncState& state);
    [[nodiscard]] Res<void> save_state(const RemoteSyncState& state);
    
    void handle_push_failure(const Uuid& id, const Error& error);
    void handle_upload_failure(const Uuid& id, const Error& error);
    void schedule_push(const Uuid& id);
    void mark_ops(const Uuid& id, OpStatus status, const std::optional<std::string>& error = std::nullopt);
    [[nodiscard]] Res<void> merge_record(const RemoteRecord& record, Partition partition, PullSummary& summary);
    
    EntityKind kind_;
    SyncContext context_;
    ImageSyncManager* images_;
    PendingSet pending_sync_;
    
    QMutex push_mutex_;
    
    QMutex background_mutex_;
    std::vector<QFuture<void>> background_;
};

} // namespace ladle::sync
