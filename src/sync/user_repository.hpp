#pragma once

#include "core/user.hpp"
#include "sync/synced_repository.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ladle::sync {

/**
 * UserRepository - Profiles, always replicated to both partitions.
 */
class UserRepository final : public SyncedRepository {
public:
    explicit UserRepository(SyncContext context, ImageSyncManager* images = nullptr);
    ~UserRepository() override;
    
    [[nodiscard]] Res<void> create(const User& user);
    [[nodiscard]] Res<std::optional<User>> fetch(const Uuid& id);
    [[nodiscard]] Res<std::optional<User>> fetch_by_username(const std::string& username);
    [[nodiscard]] Res<std::vector<User>> fetch_all();
    [[nodiscard]] Res<User> update(const User& user, bool preserve_timestamp = false);
    [[nodiscard]] Res<void> remove(const Uuid& id);

protected:
    Res<std::optional<LocalSnapshot>> snapshot(storage::Database& db, const Uuid& id) override;
    Res<std::optional<Timestamp>> local_updated_at(storage::Database& db, const Uuid& id) override;
    Res<void> store_remote(storage::Database& db, const RemoteRecord& record) override;
    std::vector<RemoteQuery> pull_queries(const Uuid& owner_id) const override;
};

} // namespace ladle::sync
