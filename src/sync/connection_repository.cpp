#include "sync/connection_repository.hpp"
#include "storage/connection_store.hpp"
#include "sync/record_codec.hpp"

#include <algorithm>

namespace ladle::sync {

namespace {

Error connection_not_found(const Uuid& id) {
    return Error{ErrorKind::NotFound, "Connection " + id.to_string() + " not found"};
}

Res<void> validate_new(storage::ConnectionStore& store, const Connection& connection) {
    if (connection.from_user_id == connection.to_user_id) {
        return Res<void>::err(Error{ErrorKind::InvalidData, "A user cannot connect to themselves"});
    }
    
    auto existing = store.get(connection.id);
    if (existing.is_err()) return Res<void>::err(existing.unwrap_err());
    if (existing.unwrap()) {
        return Res<void>::err(Error{ErrorKind::InvalidData,
                                    "Connection " + connection.id.to_string() + " already exists"});
    }
    
    auto between = store.find_between(connection.from_user_id, connection.to_user_id);
    if (between.is_err()) return Res<void>::err(between.unwrap_err());
    if (between.unwrap()) {
        return Res<void>::err(Error{ErrorKind::InvalidData, "These users already have a connection"});
    }
    return Res<void>::ok();
}

} // namespace

ConnectionRepository::ConnectionRepository(SyncContext context)
    : SyncedRepository(EntityKind::Connection, context)
{
}

ConnectionRepository::~ConnectionRepository() {
    wait_for_background();
}

Res<void> ConnectionRepository::create(const Connection& connection) {
    auto created = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<void> {
            storage::ConnectionStore store(db);
            auto valid = validate_new(store, connection);
            if (valid.is_err()) return valid;
            
            auto saved = store.save(connection);
            if (saved.is_err()) return saved;
            return record_create(db, connection.id);
        });
    });
    if (created.is_ok()) {
        after_create(connection.id, false);
    }
    return created;
}

Res<std::optional<Connection>> ConnectionRepository::fetch(const Uuid& id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::ConnectionStore(db).get(id);
    });
}

Res<std::vector<Connection>> ConnectionRepository::fetch_all() {
    return context().local.with_db([](storage::Database& db) {
        return storage::ConnectionStore(db).list_all();
    });
}

Res<std::vector<Connection>> ConnectionRepository::fetch_for_user(const Uuid& user_id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::ConnectionStore(db).list_for_user(user_id);
    });
}

Res<std::vector<Connection>> ConnectionRepository::fetch_accepted(const Uuid& user_id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::ConnectionStore(db).list_accepted(user_id);
    });
}

Res<std::vector<Connection>> ConnectionRepository::fetch_sent_requests(const Uuid& user_id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::ConnectionStore(db).list_sent_requests(user_id);
    });
}

Res<std::vector<Connection>> ConnectionRepository::fetch_received_requests(const Uuid& user_id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::ConnectionStore(db).list_received_requests(user_id);
    });
}

Res<std::optional<Connection>> ConnectionRepository::fetch_between(const Uuid& a, const Uuid& b) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::ConnectionStore(db).find_between(a, b);
    });
}

Res<bool> ConnectionRepository::are_connected(const Uuid& a, const Uuid& b) {
    return fetch_between(a, b).map([](const std::optional<Connection>& connection) {
        return connection && connection->status == ConnectionStatus::Accepted;
    });
}

Res<Connection> ConnectionRepository::update(const Connection& connection, bool preserve_timestamp) {
    auto stored = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<Connection> {
            storage::ConnectionStore store(db);
            auto existing = store.get(connection.id);
            if (existing.is_err()) return Res<Connection>::err(existing.unwrap_err());
            if (!existing.unwrap()) return Res<Connection>::err(connection_not_found(connection.id));
            
            auto next = connection;
            if (!preserve_timestamp) {
                next.updated_at = std::max(Timestamp::now(), existing.unwrap()->updated_at);
            }
            auto saved = store.save(next);
            if (saved.is_err()) return Res<Connection>::err(saved.unwrap_err());
            auto queued = record_update(db, next.id);
            if (queued.is_err()) return Res<Connection>::err(queued.unwrap_err());
            return Res<Connection>::ok(std::move(next));
        });
    });
    if (stored.is_ok()) {
        // Always public, so there is no visibility transition to report.
        after_update(connection.id, Visibility::Public, Visibility::Public, false, false);
    }
    return stored;
}

Res<Connection> ConnectionRepository::accept(const Uuid& id) {
    auto current = fetch(id);
    if (current.is_err()) return Res<Connection>::err(current.unwrap_err());
    if (!current.unwrap()) return Res<Connection>::err(connection_not_found(id));
    if (current.unwrap()->status == ConnectionStatus::Accepted) {
        return Res<Connection>::ok(*current.unwrap());
    }
    return update(accepted(*current.unwrap()));
}

Res<void> ConnectionRepository::remove(const Uuid& id) {
    auto removed = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<void> {
            storage::ConnectionStore store(db);
            auto deleted = store.remove(id);
            if (deleted.is_err()) return Res<void>::err(deleted.unwrap_err());
            if (!deleted.unwrap()) return Res<void>::err(connection_not_found(id));
            return record_delete(db, id);
        });
    });
    if (removed.is_ok()) {
        after_delete(id, false);
    }
    return removed;
}

Res<std::optional<LocalSnapshot>> ConnectionRepository::snapshot(storage::Database& db, const Uuid& id) {
    return storage::ConnectionStore(db).get(id).map([](const std::optional<Connection>& connection) {
        std::optional<LocalSnapshot> snap;
        if (connection) {
            snap = LocalSnapshot{
                .record = to_record(*connection),
                .visibility = Visibility::Public,
                .replicate_public = true,
                .has_image = false
            };
        }
        return snap;
    });
}

Res<std::optional<Timestamp>> ConnectionRepository::local_updated_at(storage::Database& db, const Uuid& id) {
    return storage::ConnectionStore(db).get(id).map([](const std::optional<Connection>& connection) {
        return connection ? std::optional<Timestamp>(connection->updated_at) : std::nullopt;
    });
}

Res<void> ConnectionRepository::store_remote(storage::Database& db, const RemoteRecord& record) {
    return connection_from_record(record).and_then([&](const Connection& connection) {
        return storage::ConnectionStore(db).save(connection);
    });
}

std::vector<RemoteQuery> ConnectionRepository::pull_queries(const Uuid& owner_id) const {
    const auto user = owner_id.to_string();
    return {
        RemoteQuery{.partition = Partition::Private, .match = FieldMatch{"from_user_id", user}},
        RemoteQuery{.partition = Partition::Public, .match = FieldMatch{"from_user_id", user}},
        RemoteQuery{.partition = Partition::Public, .match = FieldMatch{"to_user_id", user}}
    };
}

} // namespace ladle::sync
