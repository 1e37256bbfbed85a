#include "sync/synced_repository.hpp"
#include "storage/remote_state_store.hpp"
#include "storage/sync_operation_queue.hpp"
#include "storage/tombstone_store.hpp"
#include "sync/log.hpp"
#include "sync/record_codec.hpp"

#include <QMutexLocker>
#include <QtConcurrent/QtConcurrent>
#include <algorithm>
#include <map>

namespace ladle::sync {

namespace {

constexpr auto kPublicFreshnessTolerance = std::chrono::seconds(1);

QString kind_name(EntityKind kind) {
    return QString::fromStdString(to_string(kind));
}

} // namespace

SyncedRepository::SyncedRepository(EntityKind kind, SyncContext context, ImageSyncManager* images)
    : kind_(kind)
    , context_(context)
    , images_(images)
    , pending_sync_(context.config.max_attempts)
{
}

SyncedRepository::~SyncedRepository() {
    wait_for_background();
}

QString SyncedRepository::participant_name() const {
    return kind_name(kind_);
}

size_t SyncedRepository::pending_count() const {
    size_t count = pending_sync_.size();
    if (images_) {
        for (const auto& id : images_->pending_uploads().snapshot()) {
            if (!pending_sync_.contains(id)) ++count;
        }
    }
    return count;
}

Res<RemoteSyncState> SyncedRepository::remote_state(const Uuid& id) {
    return context_.local.with_db([&](storage::Database& db) {
        return storage::RemoteStateStore(db).get_or_default(kind_, id);
    });
}

// ============================================================================
// Local phase
// ============================================================================

Res<void> SyncedRepository::record_create(storage::Database& db, const Uuid& id) {
    auto unmarked = storage::TombstoneStore(db).unmark(id);
    if (unmarked.is_err()) {
        return Res<void>::err(unmarked.unwrap_err());
    }
    if (unmarked.unwrap()) {
        qCInfo(ladleSyncLog) << "Re-creating previously deleted" << kind_name(kind_) << to_qstring(id);
    }

    auto enqueued = storage::SyncOperationQueue(db).enqueue(kind_, id, OpKind::Create);
    if (enqueued.is_err()) {
        return Res<void>::err(enqueued.unwrap_err());
    }
    return Res<void>::ok();
}

Res<void> SyncedRepository::record_update(storage::Database& db, const Uuid& id) {
    auto enqueued = storage::SyncOperationQueue(db).enqueue(kind_, id, OpKind::Update);
    if (enqueued.is_err()) {
        return Res<void>::err(enqueued.unwrap_err());
    }
    return Res<void>::ok();
}

Res<void> SyncedRepository::record_delete(storage::Database& db, const Uuid& id) {
    auto state = storage::RemoteStateStore(db).get(kind_, id);
    if (state.is_err()) {
        return Res<void>::err(state.unwrap_err());
    }
    std::optional<std::string> remote_record_id;
    if (state.unwrap()) {
        remote_record_id = state.unwrap()->remote_record_id;
    }

    auto marked = storage::TombstoneStore(db).mark_deleted(kind_, id, remote_record_id);
    if (marked.is_err()) {
        return Res<void>::err(marked.unwrap_err());
    }

    storage::SyncOperationQueue queue(db);
    auto removed = queue.remove_for_entity(id);
    if (removed.is_err()) {
        return Res<void>::err(removed.unwrap_err());
    }
    auto enqueued = queue.enqueue(kind_, id, OpKind::Delete);
    if (enqueued.is_err()) {
        return Res<void>::err(enqueued.unwrap_err());
    }
    return Res<void>::ok();
}

Res<bool> SyncedRepository::image_needs_upload(storage::Database& db, const Uuid& id) {
    if (!images_) {
        return Res<bool>::ok(false);
    }
    auto snap = snapshot(db, id);
    if (snap.is_err()) {
        return Res<bool>::err(snap.unwrap_err());
    }
    const auto local_time = images_->modification_time(id);
    if (!snap.unwrap() || !snap.unwrap()->has_image || !local_time) {
        return Res<bool>::ok(false);
    }

    auto state = storage::RemoteStateStore(db).get(kind_, id);
    if (state.is_err()) {
        return Res<bool>::err(state.unwrap_err());
    }
    const auto& stored = state.unwrap();
    if (!stored || !stored->remote_asset_modified_at) {
        return Res<bool>::ok(true);
    }
    return Res<bool>::ok(*local_time > *stored->remote_asset_modified_at);
}

void SyncedRepository::after_create(const Uuid& id, bool has_image) {
    emit context_.events.entityCreated(kind_, id);
    emit context_.events.syncOperationChanged(kind_, id, OpKind::Create, OpStatus::Queued);

    if (has_image && images_ && images_->image_exists(id)) {
        images_->pending_uploads().mark(id);
        emit context_.events.assetUploadPending(kind_, id);
    }
    pending_sync_.mark(id);
    schedule_push(id);
}

void SyncedRepository::after_update(const Uuid& id, Visibility from, Visibility to,
                                    bool image_removed, bool needs_upload) {
    if (image_removed && images_) {
        images_->pending_uploads().clear(id);
        auto deleted = images_->delete_image(id);
        if (deleted.is_err()) {
            qCWarning(ladleImagesLog) << "Could not remove image of" << to_qstring(id) << ":"
                                      << QString::fromStdString(deleted.unwrap_err().message);
        }
    }

    emit context_.events.entityUpdated(kind_, id);
    if (from != to) {
        emit context_.events.visibilityChanged(kind_, id, from, to);
    }
    emit context_.events.syncOperationChanged(kind_, id, OpKind::Update, OpStatus::Queued);

    if (needs_upload && images_) {
        images_->pending_uploads().mark(id);
        emit context_.events.assetUploadPending(kind_, id);
    }
    pending_sync_.mark(id);
    schedule_push(id);
}

void SyncedRepository::after_delete(const Uuid& id, bool had_image) {
    if (images_) {
        images_->pending_uploads().clear(id);
        images_->clear_not_found_cache(id);
        if (had_image) {
            auto deleted = images_->delete_image(id);
            if (deleted.is_err()) {
                qCWarning(ladleImagesLog) << "Could not remove image of" << to_qstring(id) << ":"
                                          << QString::fromStdString(deleted.unwrap_err().message);
            }
        }
    }

    emit context_.events.entityDeleted(kind_, id);
    emit context_.events.syncOperationChanged(kind_, id, OpKind::Delete, OpStatus::Queued);

    pending_sync_.mark(id);
    schedule_push(id);
}

// ============================================================================
// Background phase
// ============================================================================

void SyncedRepository::schedule_push(const Uuid& id) {
    auto future = QtConcurrent::run(&context_.pool, [this, id] {
        auto pushed = push(id);
        if (pushed.is_err()) {
            qCDebug(ladleSyncLog) << kind_name(kind_) << to_qstring(id) << "left for the retry scheduler";
        }
    });

    QMutexLocker lock(&background_mutex_);
    background_.erase(std::remove_if(background_.begin(), background_.end(),
                                     [](const QFuture<void>& f) { return f.isFinished(); }),
                      background_.end());
    background_.push_back(future);
}

void SyncedRepository::wait_for_background() {
    while (true) {
        std::vector<QFuture<void>> running;
        {
            QMutexLocker lock(&background_mutex_);
            running.swap(background_);
        }
        if (running.empty()) {
            return;
        }
        for (auto& future : running) {
            future.waitForFinished();
        }
    }
}

void SyncedRepository::mark_ops(const Uuid& id, OpStatus status, const std::optional<std::string>& error) {
    auto changed = context_.local.with_db([&](storage::Database& db) -> Res<std::vector<OpKind>> {
        storage::SyncOperationQueue queue(db);
        auto ops = queue.pending_for_entity(kind_, id);
        if (ops.is_err()) {
            return Res<std::vector<OpKind>>::err(ops.unwrap_err());
        }

        Res<int> updated = Res<int>::ok(0);
        switch (status) {
            case OpStatus::Completed: updated = queue.complete_for_entity(kind_, id); break;
            case OpStatus::Failed: updated = queue.fail_for_entity(kind_, id, error.value_or("unknown error")); break;
            case OpStatus::InProgress:
            case OpStatus::Queued: break;
        }
        if (updated.is_err()) {
            return Res<std::vector<OpKind>>::err(updated.unwrap_err());
        }

        std::vector<OpKind> kinds;
        for (const auto& op : ops.unwrap()) {
            if (status == OpStatus::Completed && op.status != OpStatus::InProgress) continue;
            kinds.push_back(op.op_kind);
        }
        return Res<std::vector<OpKind>>::ok(std::move(kinds));
    });

    if (changed.is_err()) {
        qCWarning(ladleQueueLog) << "Could not move" << kind_name(kind_) << to_qstring(id) << "operations to"
                                 << QString::fromStdString(to_string(status)) << ":"
                                 << QString::fromStdString(changed.unwrap_err().message);
        return;
    }
    for (auto op : changed.unwrap()) {
        qCDebug(ladleQueueLog) << kind_name(kind_) << to_qstring(id) << QString::fromStdString(to_string(op))
                               << "->" << QString::fromStdString(to_string(status));
        emit context_.events.syncOperationChanged(kind_, id, op, status);
    }
}

Res<void> SyncedRepository::save_state(const RemoteSyncState& state) {
    return context_.local.with_db([&](storage::Database& db) {
        return storage::RemoteStateStore(db).save(state);
    });
}

Res<void> SyncedRepository::push(const Uuid& id) {
    QMutexLocker lock(&push_mutex_);

    // A write landing while this push runs marks the id again; its own push follows.
    const auto sync_generation = pending_sync_.generation(id);
    const auto upload_generation = images_ ? images_->pending_uploads().generation(id) : 0;

    auto pushed = push_locked(id, upload_generation);
    if (pushed.is_err()) {
        handle_push_failure(id, pushed.unwrap_err());
        return Res<void>::err(pushed.unwrap_err());
    }

    if (!pending_sync_.clear_if_unchanged(id, sync_generation)) {
        qCDebug(ladleSyncLog) << kind_name(kind_) << to_qstring(id) << "changed during push, kept pending";
    }

    const auto& upload_error = pushed.unwrap().upload_error;
    if (upload_error) {
        handle_upload_failure(id, *upload_error);
        return Res<void>::err(*upload_error);
    }
    if (images_) {
        images_->pending_uploads().clear_if_unchanged(id, upload_generation);
    }
    mark_ops(id, OpStatus::Completed);
    return Res<void>::ok();
}

Res<SyncedRepository::PushOutcome> SyncedRepository::push_locked(const Uuid& id, uint64_t upload_generation) {
    struct Loaded {
        std::optional<LocalSnapshot> snapshot;
        RemoteSyncState state;
        bool tombstoned{false};
        std::vector<OpKind> started;
    };

    // The queue rows are started together with the read, so exactly the
    // rows this snapshot covers are completed when the push succeeds.
    auto loaded = context_.local.with_db([&](storage::Database& db) -> Res<Loaded> {
        auto snap = snapshot(db, id);
        if (snap.is_err()) return Res<Loaded>::err(snap.unwrap_err());
        auto state = storage::RemoteStateStore(db).get_or_default(kind_, id);
        if (state.is_err()) return Res<Loaded>::err(state.unwrap_err());
        auto deleted = storage::TombstoneStore(db).is_deleted(id);
        if (deleted.is_err()) return Res<Loaded>::err(deleted.unwrap_err());

        storage::SyncOperationQueue queue(db);
        auto ops = queue.pending_for_entity(kind_, id);
        if (ops.is_err()) return Res<Loaded>::err(ops.unwrap_err());
        auto started = queue.start_for_entity(kind_, id);
        if (started.is_err()) return Res<Loaded>::err(started.unwrap_err());

        Loaded current{
            .snapshot = std::move(snap).unwrap(),
            .state = std::move(state).unwrap(),
            .tombstoned = deleted.unwrap()
        };
        for (const auto& op : ops.unwrap()) {
            current.started.push_back(op.op_kind);
        }
        return Res<Loaded>::ok(std::move(current));
    });
    if (loaded.is_err()) {
        return Res<PushOutcome>::err(loaded.unwrap_err());
    }

    auto& current = loaded.unwrap();
    for (auto op : current.started) {
        emit context_.events.syncOperationChanged(kind_, id, op, OpStatus::InProgress);
    }

    if (current.snapshot) {
        return push_existing(id, *current.snapshot, current.state, upload_generation);
    }
    if (current.tombstoned) {
        auto deleted = push_deletion(id, current.state);
        if (deleted.is_err()) {
            return Res<PushOutcome>::err(deleted.unwrap_err());
        }
        return Res<PushOutcome>::ok(PushOutcome{});
    }

    qCDebug(ladleSyncLog) << "Nothing to push for" << kind_name(kind_) << to_qstring(id);
    return Res<PushOutcome>::ok(PushOutcome{});
}

Res<SyncedRepository::PushOutcome> SyncedRepository::push_existing(
    const Uuid& id, const LocalSnapshot& snapshot, RemoteSyncState& state, uint64_t upload_generation
) {
    // Whatever was achieved before a failure is kept, so a retry resumes from there.
    auto fail = [&](const Error& error) {
        auto saved = save_state(state);
        if (saved.is_err()) {
            qCWarning(ladleSyncLog) << "Could not record partial sync state for" << to_qstring(id) << ":"
                                    << QString::fromStdString(saved.unwrap_err().message);
        }
        return Res<PushOutcome>::err(error);
    };
    PushOutcome outcome;

    auto saved = context_.remote.save_record(Partition::Private, snapshot.record);
    if (saved.is_err()) {
        return fail(saved.unwrap_err());
    }
    state.remote_record_id = snapshot.record.record_id;

    if (images_) {
        if (snapshot.has_image && images_->image_exists(id)) {
            // The record goes out even when its image cannot.
            auto image = push_image(id, snapshot.replicate_public, state, upload_generation);
            if (image.is_err()) {
                outcome.upload_error = image.unwrap_err();
            }
        } else if (!snapshot.has_image && state.remote_asset_record_id) {
            auto removed = images_->delete_from_cloud(id, Partition::Private);
            if (removed.is_err()) {
                return fail(removed.unwrap_err());
            }
            state.remote_asset_record_id.reset();
            state.remote_asset_modified_at.reset();
        }
    }

    if (snapshot.replicate_public) {
        auto published = context_.remote.save_record(Partition::Public, snapshot.record);
        if (published.is_err()) {
            return fail(published.unwrap_err());
        }
        state.public_record_id = snapshot.record.record_id;

        if (images_ && !snapshot.has_image && state.public_asset_modified_at) {
            auto removed = images_->delete_from_cloud(id, Partition::Public);
            if (removed.is_err()) {
                return fail(removed.unwrap_err());
            }
            state.public_asset_modified_at.reset();
        }
    } else if (state.public_record_id) {
        auto dropped = drop_public_copy(id, state);
        if (dropped.is_err()) {
            return fail(dropped.unwrap_err());
        }
    }

    state.last_synced_at = Timestamp::now();
    auto recorded = save_state(state);
    if (recorded.is_err()) {
        return Res<PushOutcome>::err(recorded.unwrap_err());
    }
    emit context_.events.metadataChanged(kind_, id);
    qCDebug(ladleSyncLog) << "Pushed" << kind_name(kind_) << to_qstring(id)
                          << (snapshot.replicate_public ? "to both partitions" : "to private partition");
    return Res<PushOutcome>::ok(std::move(outcome));
}

Res<void> SyncedRepository::push_image(const Uuid& id, bool replicate_public, RemoteSyncState& state,
                                       uint64_t upload_generation) {
    const auto local_time = images_->modification_time(id);
    if (!local_time) {
        return Res<void>::ok();
    }

    const bool private_stale = images_->pending_uploads().contains(id) ||
                               !state.remote_asset_modified_at ||
                               *local_time > *state.remote_asset_modified_at;
    if (private_stale) {
        auto uploaded = images_->upload_to_cloud(id, Partition::Private);
        if (uploaded.is_err()) {
            return Res<void>::err(uploaded.unwrap_err());
        }
        state.remote_asset_record_id = uploaded.unwrap();
        state.remote_asset_modified_at = *local_time;
        emit context_.events.assetUploadCompleted(kind_, id);
    }

    const bool public_stale = !state.public_asset_modified_at ||
                              *local_time > *state.public_asset_modified_at + kPublicFreshnessTolerance;
    if (replicate_public && public_stale) {
        auto uploaded = images_->upload_to_cloud(id, Partition::Public);
        if (uploaded.is_err()) {
            return Res<void>::err(uploaded.unwrap_err());
        }
        state.public_asset_modified_at = *local_time;
    }

    images_->pending_uploads().clear_if_unchanged(id, upload_generation);
    return Res<void>::ok();
}

Res<void> SyncedRepository::drop_public_copy(const Uuid& id, RemoteSyncState& state) {
    auto removed = ignore_not_found(context_.remote.delete_record(
        Partition::Public, remote_record_type(kind_), *state.public_record_id));
    if (removed.is_err()) {
        return removed;
    }
    state.public_record_id.reset();

    if (images_ && state.public_asset_modified_at) {
        auto asset = images_->delete_from_cloud(id, Partition::Public);
        if (asset.is_err()) {
            return asset;
        }
        state.public_asset_modified_at.reset();
    }
    qCInfo(ladleSyncLog) << "Removed public copy of" << kind_name(kind_) << to_qstring(id);
    return Res<void>::ok();
}

Res<void> SyncedRepository::push_deletion(const Uuid& id, RemoteSyncState& state) {
    const auto record_type = remote_record_type(kind_);
    const auto record_id = state.remote_record_id.value_or(id.to_string());

    auto removed = ignore_not_found(context_.remote.delete_record(Partition::Private, record_type, record_id));
    if (removed.is_err()) {
        return removed;
    }
    if (images_ && state.remote_asset_record_id) {
        auto asset = images_->delete_from_cloud(id, Partition::Private);
        if (asset.is_err()) {
            return asset;
        }
    }
    if (state.public_record_id) {
        auto dropped = drop_public_copy(id, state);
        if (dropped.is_err()) {
            return dropped;
        }
    }

    auto forgotten = context_.local.with_db([&](storage::Database& db) {
        return storage::RemoteStateStore(db).remove(kind_, id);
    });
    if (forgotten.is_err()) {
        return Res<void>::err(forgotten.unwrap_err());
    }
    qCInfo(ladleSyncLog) << "Deleted remote copies of" << kind_name(kind_) << to_qstring(id);
    return Res<void>::ok();
}

void SyncedRepository::handle_push_failure(const Uuid& id, const Error& error) {
    const auto message = QString::fromStdString(error.message);
    qCWarning(ladleSyncLog) << "Sync of" << kind_name(kind_) << to_qstring(id) << "failed ("
                            << to_string(error.kind) << "):" << message;

    mark_ops(id, OpStatus::Failed, error.message);
    emit context_.events.syncError(kind_, id, message);

    if (is_retryable(error)) {
        if (pending_sync_.contains(id) && !pending_sync_.record_failure(id)) {
            qCWarning(ladleSyncLog) << "Giving up on" << kind_name(kind_) << to_qstring(id) << "after"
                                    << pending_sync_.max_attempts() << "attempts";
        }
    } else {
        pending_sync_.clear(id);
    }

    if (images_ && images_->pending_uploads().contains(id)) {
        images_->note_upload_failure(id, error);
    }
}

void SyncedRepository::handle_upload_failure(const Uuid& id, const Error& error) {
    const auto message = QString::fromStdString(error.message);
    qCWarning(ladleImagesLog) << "Image upload for" << kind_name(kind_) << to_qstring(id) << "failed ("
                              << to_string(error.kind) << "):" << message;
    emit context_.events.syncError(kind_, id, message);

    // A retryable failure keeps the row so a restart picks the upload up again.
    if (is_retryable(error)) {
        mark_ops(id, OpStatus::Failed, error.message);
    } else {
        mark_ops(id, OpStatus::Completed);
    }
    images_->note_upload_failure(id, error);
}

SweepResult SyncedRepository::retry_pending(const std::atomic_bool& cancelled) {
    std::vector<Uuid> ids = pending_sync_.snapshot();
    if (images_) {
        const auto uploads = images_->pending_uploads().snapshot();
        ids.insert(ids.end(), uploads.begin(), uploads.end());
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    }

    SweepResult result;
    for (const auto& id : ids) {
        if (cancelled) {
            result.cancelled = true;
            break;
        }
        ++result.attempted;
        auto pushed = push(id);
        if (pushed.is_ok()) {
            ++result.succeeded;
            continue;
        }
        ++result.failed;
        const bool still_pending = pending_sync_.contains(id) ||
                                   (images_ && images_->pending_uploads().contains(id));
        if (!still_pending) {
            ++result.dropped;
        }
    }
    return result;
}

Res<int> SyncedRepository::restore_pending() {
    auto ops = context_.local.with_db([&](storage::Database& db) {
        return storage::SyncOperationQueue(db).pending_for_kind(kind_);
    });
    if (ops.is_err()) {
        return Res<int>::err(ops.unwrap_err());
    }

    std::vector<Uuid> ids;
    for (const auto& op : ops.unwrap()) {
        if (std::find(ids.begin(), ids.end(), op.entity_id) == ids.end()) {
            ids.push_back(op.entity_id);
        }
    }

    for (const auto& id : ids) {
        pending_sync_.mark(id);
        auto stale = context_.local.with_db([&](storage::Database& db) {
            return image_needs_upload(db, id);
        });
        if (stale.is_err()) {
            return Res<int>::err(stale.unwrap_err());
        }
        if (stale.unwrap()) {
            images_->pending_uploads().mark(id);
        }
    }

    if (!ids.empty()) {
        qCInfo(ladleSyncLog) << "Restored" << ids.size() << "pending" << kind_name(kind_) << "syncs";
    }
    return Res<int>::ok(static_cast<int>(ids.size()));
}

// ============================================================================
// Pull
// ============================================================================

Res<PullSummary> SyncedRepository::sync_from_remote(const Uuid& owner_id) {
    const auto record_type = remote_record_type(kind_);

    // Records seen in more than one query are merged once, private copy first.
    std::map<std::string, std::pair<RemoteRecord, Partition>> records;
    for (const auto& query : pull_queries(owner_id)) {
        auto fetched = context_.remote.query_records(query.partition, record_type, query.match);
        if (fetched.is_err()) {
            qCWarning(ladleSyncLog) << "Pull of" << kind_name(kind_) << "records failed:"
                                    << QString::fromStdString(fetched.unwrap_err().message);
            return Res<PullSummary>::err(fetched.unwrap_err());
        }
        for (auto& record : fetched.unwrap()) {
            const auto record_id = record.record_id;
            records.emplace(record_id, std::make_pair(std::move(record), query.partition));
        }
    }

    PullSummary summary;
    for (const auto& [record_id, entry] : records) {
        auto merged = merge_record(entry.first, entry.second, summary);
        if (merged.is_err()) {
            return Res<PullSummary>::err(merged.unwrap_err());
        }
    }

    auto cleaned = context_.local.with_db([&](storage::Database& db) {
        return storage::TombstoneStore(db).cleanup(context_.config.tombstone_retention);
    });
    if (cleaned.is_err()) {
        return Res<PullSummary>::err(cleaned.unwrap_err());
    }
    summary.tombstones_cleaned = cleaned.unwrap();

    qCInfo(ladleSyncLog) << "Pulled" << kind_name(kind_) << "records: inserted" << summary.inserted
                         << "updated" << summary.updated << "pushed" << summary.pushed
                         << "tombstoned" << summary.skipped_tombstoned << "invalid" << summary.invalid;
    return Res<PullSummary>::ok(summary);
}

Res<void> SyncedRepository::merge_record(const RemoteRecord& record, Partition partition, PullSummary& summary) {
    enum class Action { Skip, Insert, Update, Push, Unchanged };

    const auto id = Uuid::parse(record.record_id);
    const auto remote_time = record_updated_at(record);
    if (!id || !remote_time) {
        qCWarning(ladleSyncLog) << "Ignoring malformed" << kind_name(kind_) << "record"
                                << QString::fromStdString(record.record_id);
        ++summary.invalid;
        return Res<void>::ok();
    }

    // The tombstone check and the write share one lock so a concurrent
    // delete cannot slip between them.
    auto decided = context_.local.with_db([&](storage::Database& db) -> Res<Action> {
        auto deleted = storage::TombstoneStore(db).is_deleted(*id);
        if (deleted.is_err()) return Res<Action>::err(deleted.unwrap_err());
        if (deleted.unwrap()) return Res<Action>::ok(Action::Skip);

        auto local_time = local_updated_at(db, *id);
        if (local_time.is_err()) return Res<Action>::err(local_time.unwrap_err());

        Action action = Action::Unchanged;
        if (!local_time.unwrap()) {
            action = Action::Insert;
        } else if (*remote_time > *local_time.unwrap()) {
            action = Action::Update;
        } else if (*local_time.unwrap() > *remote_time) {
            return Res<Action>::ok(Action::Push);
        }

        if (action != Action::Unchanged) {
            auto stored = store_remote(db, record);
            if (stored.is_err()) return Res<Action>::err(stored.unwrap_err());
        }

        storage::RemoteStateStore states(db);
        auto state = states.get_or_default(kind_, *id);
        if (state.is_err()) return Res<Action>::err(state.unwrap_err());
        auto updated = std::move(state).unwrap();
        if (partition == Partition::Private) {
            updated.remote_record_id = record.record_id;
        } else {
            updated.public_record_id = record.record_id;
        }
        updated.last_synced_at = Timestamp::now();
        auto saved = states.save(updated);
        if (saved.is_err()) return Res<Action>::err(saved.unwrap_err());
        return Res<Action>::ok(action);
    });

    if (decided.is_err()) {
        if (decided.unwrap_err().kind == ErrorKind::InvalidData) {
            qCWarning(ladleSyncLog) << "Ignoring invalid" << kind_name(kind_) << "record"
                                    << QString::fromStdString(record.record_id) << ":"
                                    << QString::fromStdString(decided.unwrap_err().message);
            ++summary.invalid;
            return Res<void>::ok();
        }
        return Res<void>::err(decided.unwrap_err());
    }

    switch (decided.unwrap()) {
        case Action::Skip:
            qCDebug(ladleSyncLog) << "Skipping tombstoned" << kind_name(kind_) << to_qstring(*id);
            ++summary.skipped_tombstoned;
            return Res<void>::ok();
        case Action::Push:
            ++summary.pushed;
            pending_sync_.mark(*id);
            schedule_push(*id);
            return Res<void>::ok();
        case Action::Unchanged:
            ++summary.unchanged;
            emit context_.events.metadataChanged(kind_, *id);
            return Res<void>::ok();
        case Action::Insert:
            ++summary.inserted;
            emit context_.events.entityCreated(kind_, *id);
            break;
        case Action::Update:
            ++summary.updated;
            emit context_.events.entityUpdated(kind_, *id);
            break;
    }

    if (!images_) {
        return Res<void>::ok();
    }
    auto snap = context_.local.with_db([&](storage::Database& db) { return snapshot(db, *id); });
    if (snap.is_err()) {
        return Res<void>::err(snap.unwrap_err());
    }
    if (!snap.unwrap() || !snap.unwrap()->has_image || images_->image_exists(*id)) {
        return Res<void>::ok();
    }

    auto downloaded = images_->download_from_cloud(*id, partition);
    if (downloaded.is_err()) {
        qCWarning(ladleImagesLog) << "Image of" << to_qstring(*id) << "not downloaded:"
                                  << QString::fromStdString(downloaded.unwrap_err().message);
        return Res<void>::ok();
    }
    if (!downloaded.unwrap()) {
        return Res<void>::ok();
    }

    ++summary.images_downloaded;
    const auto local_time = images_->modification_time(*id);
    return context_.local.with_db([&](storage::Database& db) -> Res<void> {
        storage::RemoteStateStore states(db);
        auto state = states.get_or_default(kind_, *id);
        if (state.is_err()) return Res<void>::err(state.unwrap_err());
        auto updated = std::move(state).unwrap();
        if (partition == Partition::Private) {
            updated.remote_asset_record_id = asset_id_for(remote_record_type(kind_), *id);
            updated.remote_asset_modified_at = local_time;
        } else {
            updated.public_asset_modified_at = local_time;
        }
        return states.save(updated);
    });
}

} // namespace ladle::sync
