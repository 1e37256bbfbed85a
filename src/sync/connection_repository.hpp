#pragma once

#include "core/connection.hpp"
#include "sync/synced_repository.hpp"
#include <optional>
#include <vector>

namespace ladle::sync {

/**
 * ConnectionRepository - Friend requests and friendships.
 *
 * Both participants must see a connection, so every connection is copied
 * to the public partition in addition to the sender's private one.
 */
class ConnectionRepository final : public SyncedRepository {
public:
    explicit ConnectionRepository(SyncContext context);
    ~ConnectionRepository() override;
    
    /**
     * Store a new request. InvalidData for a self-connection, a duplicate
     * id, or when the two users are already connected in either direction.
     */
    [[nodiscard]] Res<void> create(const Connection& connection);
    
    [[nodiscard]] Res<std::optional<Connection>> fetch(const Uuid& id);
    [[nodiscard]] Res<std::vector<Connection>> fetch_all();
    [[nodiscard]] Res<std::vector<Connection>> fetch_for_user(const Uuid& user_id);
    [[nodiscard]] Res<std::vector<Connection>> fetch_accepted(const Uuid& user_id);
    [[nodiscard]] Res<std::vector<Connection>> fetch_sent_requests(const Uuid& user_id);
    [[nodiscard]] Res<std::vector<Connection>> fetch_received_requests(const Uuid& user_id);
    [[nodiscard]] Res<std::optional<Connection>> fetch_between(const Uuid& a, const Uuid& b);
    [[nodiscard]] Res<bool> are_connected(const Uuid& a, const Uuid& b);
    
    [[nodiscard]] Res<Connection> update(const Connection& connection, bool preserve_timestamp = false);
    [[nodiscard]] Res<Connection> accept(const Uuid& id);
    [[nodiscard]] Res<void> remove(const Uuid& id);

protected:
    Res<std::optional<LocalSnapshot>> snapshot(storage::Database& db, const Uuid& id) override;
    Res<std::optional<Timestamp>> local_updated_at(storage::Database& db, const Uuid& id) override;
    Res<void> store_remote(storage::Database& db, const RemoteRecord& record) override;
    std::vector<RemoteQuery> pull_queries(const Uuid& owner_id) const override;
};

} // namespace ladle::sync
