#include "sync/user_repository.hpp"
#include "storage/user_store.hpp"
#include "sync/record_codec.hpp"

#include <algorithm>

namespace ladle::sync {

namespace {

Error user_not_found(const Uuid& id) {
    return Error{ErrorKind::NotFound, "User " + id.to_string() + " not found"};
}

} // namespace

UserRepository::UserRepository(SyncContext context, ImageSyncManager* images)
    : SyncedRepository(EntityKind::User, context, images)
{
}

UserRepository::~UserRepository() {
    wait_for_background();
}

Res<void> UserRepository::create(const User& user) {
    auto created = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<void> {
            storage::UserStore store(db);
            auto existing = store.get(user.id);
            if (existing.is_err()) return Res<void>::err(existing.unwrap_err());
            if (existing.unwrap()) {
                return Res<void>::err(Error{ErrorKind::InvalidData, "User " + user.id.to_string() + " already exists"});
            }
            
            auto taken = store.find_by_username(user.username);
            if (taken.is_err()) return Res<void>::err(taken.unwrap_err());
            if (taken.unwrap()) {
                return Res<void>::err(Error{ErrorKind::InvalidData, "Username " + user.username + " is taken"});
            }
            
            auto saved = store.save(user);
            if (saved.is_err()) return saved;
            return record_create(db, user.id);
        });
    });
    if (created.is_ok()) {
        after_create(user.id, user.profile_image_filename.has_value());
    }
    return created;
}

Res<std::optional<User>> UserRepository::fetch(const Uuid& id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::UserStore(db).get(id);
    });
}

Res<std::optional<User>> UserRepository::fetch_by_username(const std::string& username) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::UserStore(db).find_by_username(username);
    });
}

Res<std::vector<User>> UserRepository::fetch_all() {
    return context().local.with_db([](storage::Database& db) {
        return storage::UserStore(db).list_all();
    });
}

Res<User> UserRepository::update(const User& user, bool preserve_timestamp) {
    struct Applied {
        bool image_removed{false};
        bool needs_upload{false};
        User stored;
    };
    
    auto applied = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<Applied> {
            storage::UserStore store(db);
            auto existing = store.get(user.id);
            if (existing.is_err()) return Res<Applied>::err(existing.unwrap_err());
            if (!existing.unwrap()) return Res<Applied>::err(user_not_found(user.id));
            const auto& before = *existing.unwrap();
            
            Applied result{.stored = user};
            result.image_removed = before.profile_image_filename.has_value() && !user.profile_image_filename.has_value();
            if (!preserve_timestamp) {
                result.stored.updated_at = std::max(Timestamp::now(), before.updated_at);
            }
            
            auto saved = store.save(result.stored);
            if (saved.is_err()) return Res<Applied>::err(saved.unwrap_err());
            auto queued = record_update(db, user.id);
            if (queued.is_err()) return Res<Applied>::err(queued.unwrap_err());
            
            if (result.stored.profile_image_filename) {
                auto stale = image_needs_upload(db, user.id);
                if (stale.is_err()) return Res<Applied>::err(stale.unwrap_err());
                result.needs_upload = stale.unwrap();
            }
            return Res<Applied>::ok(std::move(result));
        });
    });
    if (applied.is_err()) {
        return Res<User>::err(applied.unwrap_err());
    }
    
    const auto& change = applied.unwrap();
    after_update(user.id, Visibility::Public, Visibility::Public, change.image_removed, change.needs_upload);
    return Res<User>::ok(change.stored);
}

Res<void> UserRepository::remove(const Uuid& id) {
    auto removed = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<bool> {
            storage::UserStore store(db);
            auto existing = store.get(id);
            if (existing.is_err()) return Res<bool>::err(existing.unwrap_err());
            if (!existing.unwrap()) return Res<bool>::err(user_not_found(id));
            
            auto deleted = store.remove(id);
            if (deleted.is_err()) return Res<bool>::err(deleted.unwrap_err());
            auto recorded = record_delete(db, id);
            if (recorded.is_err()) return Res<bool>::err(recorded.unwrap_err());
            return Res<bool>::ok(existing.unwrap()->profile_image_filename.has_value());
        });
    });
    if (removed.is_err()) {
        return Res<void>::err(removed.unwrap_err());
    }
    
    after_delete(id, removed.unwrap());
    return Res<void>::ok();
}

Res<std::optional<LocalSnapshot>> UserRepository::snapshot(storage::Database& db, const Uuid& id) {
    return storage::UserStore(db).get(id).map([](const std::optional<User>& user) {
        std::optional<LocalSnapshot> snap;
        if (user) {
            snap = LocalSnapshot{
                .record = to_record(*user),
                .visibility = Visibility::Public,
                .replicate_public = true,
                .has_image = user->profile_image_filename.has_value()
            };
        }
        return snap;
    });
}

Res<std::optional<Timestamp>> UserRepository::local_updated_at(storage::Database& db, const Uuid& id) {
    return storage::UserStore(db).get(id).map([](const std::optional<User>& user) {
        return user ? std::optional<Timestamp>(user->updated_at) : std::nullopt;
    });
}

Res<void> UserRepository::store_remote(storage::Database& db, const RemoteRecord& record) {
    return user_from_record(record).and_then([&](const User& user) {
        return storage::UserStore(db).save(user);
    });
}

std::vector<RemoteQuery> UserRepository::pull_queries(const Uuid& owner_id) const {
    const auto id = owner_id.to_string();
    return {
        RemoteQuery{.partition = Partition::Private, .match = FieldMatch{"id", id}},
        RemoteQuery{.partition = Partition::Public, .match = FieldMatch{"id", id}}
    };
}

} // namespace ladle::sync
