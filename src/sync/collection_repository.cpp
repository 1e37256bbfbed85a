#include "sync/collection_repository.hpp"
#include "storage/collection_store.hpp"
#include "sync/log.hpp"
#include "sync/record_codec.hpp"

#include <algorithm>

namespace ladle::sync {

namespace {

Error collection_not_found(const Uuid& id) {
    return Error{ErrorKind::NotFound, "Collection " + id.to_string() + " not found"};
}

struct AppliedChange {
    Collection before;
    Collection stored;
    bool needs_upload{false};
};

} // namespace

CollectionRepository::CollectionRepository(SyncContext context, ImageSyncManager* images)
    : SyncedRepository(EntityKind::Collection, context, images)
{
}

CollectionRepository::~CollectionRepository() {
    wait_for_background();
}

Res<void> CollectionRepository::create(const Collection& collection) {
    auto created = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<void> {
            storage::CollectionStore store(db);
            auto existing = store.get(collection.id);
            if (existing.is_err()) return Res<void>::err(existing.unwrap_err());
            if (existing.unwrap()) {
                return Res<void>::err(Error{ErrorKind::InvalidData,
                                            "Collection " + collection.id.to_string() + " already exists"});
            }
            
            auto saved = store.save(collection);
            if (saved.is_err()) return saved;
            return record_create(db, collection.id);
        });
    });
    if (created.is_ok()) {
        after_create(collection.id, collection.cover_image_filename.has_value());
    }
    return created;
}

Res<std::optional<Collection>> CollectionRepository::fetch(const Uuid& id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::CollectionStore(db).get(id);
    });
}

Res<std::vector<Collection>> CollectionRepository::fetch_all() {
    return context().local.with_db([](storage::Database& db) {
        return storage::CollectionStore(db).list_all();
    });
}

Res<std::vector<Collection>> CollectionRepository::fetch_by_user(const Uuid& user_id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::CollectionStore(db).list_by_user(user_id);
    });
}

Res<std::vector<Collection>> CollectionRepository::fetch_containing(const Uuid& recipe_id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::CollectionStore(db).list_containing(recipe_id);
    });
}

template<typename F>
Res<Collection> CollectionRepository::modify(const Uuid& id, F&& change) {
    auto applied = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<std::optional<AppliedChange>> {
            storage::CollectionStore store(db);
            auto existing = store.get(id);
            if (existing.is_err()) return Res<std::optional<AppliedChange>>::err(existing.unwrap_err());
            if (!existing.unwrap()) {
                return Res<std::optional<AppliedChange>>::err(collection_not_found(id));
            }
            
            AppliedChange result{.before = *existing.unwrap()};
            result.stored = change(result.before);
            if (result.stored == result.before) {
                // Nothing to write or push.
                return Res<std::optional<AppliedChange>>::ok(std::nullopt);
            }
            
            auto saved = store.save(result.stored);
            if (saved.is_err()) return Res<std::optional<AppliedChange>>::err(saved.unwrap_err());
            auto queued = record_update(db, id);
            if (queued.is_err()) return Res<std::optional<AppliedChange>>::err(queued.unwrap_err());
            
            if (result.stored.cover_image_filename) {
                auto stale = image_needs_upload(db, id);
                if (stale.is_err()) return Res<std::optional<AppliedChange>>::err(stale.unwrap_err());
                result.needs_upload = stale.unwrap();
            }
            return Res<std::optional<AppliedChange>>::ok(std::move(result));
        });
    });
    if (applied.is_err()) {
        return Res<Collection>::err(applied.unwrap_err());
    }
    
    if (!applied.unwrap()) {
        // Unchanged: hand back what is stored.
        auto current = fetch(id);
        if (current.is_err()) return Res<Collection>::err(current.unwrap_err());
        if (!current.unwrap()) return Res<Collection>::err(collection_not_found(id));
        return Res<Collection>::ok(*current.unwrap());
    }
    
    const auto& done = *applied.unwrap();
    after_update(id, done.before.visibility, done.stored.visibility,
                 done.before.cover_image_filename.has_value() && !done.stored.cover_image_filename.has_value(),
                 done.needs_upload);
    return Res<Collection>::ok(done.stored);
}

Res<Collection> CollectionRepository::update(const Collection& collection, bool preserve_timestamp) {
    return modify(collection.id, [&](const Collection& before) {
        auto next = collection;
        if (!preserve_timestamp) {
            next.updated_at = std::max(Timestamp::now(), before.updated_at);
        }
        return next;
    });
}

Res<void> CollectionRepository::remove(const Uuid& id) {
    auto removed = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<bool> {
            storage::CollectionStore store(db);
            auto existing = store.get(id);
            if (existing.is_err()) return Res<bool>::err(existing.unwrap_err());
            if (!existing.unwrap()) return Res<bool>::err(collection_not_found(id));
            
            auto deleted = store.remove(id);
            if (deleted.is_err()) return Res<bool>::err(deleted.unwrap_err());
            auto recorded = record_delete(db, id);
            if (recorded.is_err()) return Res<bool>::err(recorded.unwrap_err());
            return Res<bool>::ok(existing.unwrap()->cover_image_filename.has_value());
        });
    });
    if (removed.is_err()) {
        return Res<void>::err(removed.unwrap_err());
    }
    
    after_delete(id, removed.unwrap());
    return Res<void>::ok();
}

Res<Collection> CollectionRepository::add_recipe(const Uuid& collection_id, const Uuid& recipe_id) {
    return modify(collection_id, [&](const Collection& before) {
        return with_recipe_added(before, recipe_id);
    });
}

Res<Collection> CollectionRepository::remove_recipe(const Uuid& collection_id, const Uuid& recipe_id) {
    return modify(collection_id, [&](const Collection& before) {
        return with_recipe_removed(before, recipe_id);
    });
}

Res<int> CollectionRepository::remove_recipe_from_all(const Uuid& recipe_id) {
    auto holders = fetch_containing(recipe_id);
    if (holders.is_err()) {
        return Res<int>::err(holders.unwrap_err());
    }
    
    int changed = 0;
    for (const auto& collection : holders.unwrap()) {
        auto result = remove_recipe(collection.id, recipe_id);
        if (result.is_err()) {
            return Res<int>::err(result.unwrap_err());
        }
        ++changed;
    }
    if (changed > 0) {
        qCDebug(ladleSyncLog) << "Removed recipe" << to_qstring(recipe_id) << "from" << changed << "collections";
    }
    return Res<int>::ok(changed);
}

Res<std::optional<LocalSnapshot>> CollectionRepository::snapshot(storage::Database& db, const Uuid& id) {
    return storage::CollectionStore(db).get(id).map([](const std::optional<Collection>& collection) {
        std::optional<LocalSnapshot> snap;
        if (collection) {
            snap = LocalSnapshot{
                .record = to_record(*collection),
                .visibility = collection->visibility,
                .replicate_public = collection->visibility == Visibility::Public,
                .has_image = collection->cover_image_filename.has_value()
            };
        }
        return snap;
    });
}

Res<std::optional<Timestamp>> CollectionRepository::local_updated_at(storage::Database& db, const Uuid& id) {
    return storage::CollectionStore(db).get(id).map([](const std::optional<Collection>& collection) {
        return collection ? std::optional<Timestamp>(collection->updated_at) : std::nullopt;
    });
}

Res<void> CollectionRepository::store_remote(storage::Database& db, const RemoteRecord& record) {
    return collection_from_record(record).and_then([&](const Collection& collection) {
        return storage::CollectionStore(db).save(collection);
    });
}

std::vector<RemoteQuery> CollectionRepository::pull_queries(const Uuid& owner_id) const {
    return {RemoteQuery{.partition = Partition::Private, .match = FieldMatch{"user_id", owner_id.to_string()}}};
}

} // namespace ladle::sync
