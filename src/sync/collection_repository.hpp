#pragma once

#include "core/collection.hpp"
#include "sync/synced_repository.hpp"
#include <optional>
#include <vector>

namespace ladle::sync {

/**
 * CollectionRepository - Local-first collection CRUD and recipe membership.
 *
 * Membership changes are ordinary updates: they bump updated_at and are
 * pushed like any other edit.
 */
class CollectionRepository final : public SyncedRepository {
public:
    explicit CollectionRepository(SyncContext context, ImageSyncManager* images = nullptr);
    ~CollectionRepository() override;
    
    [[nodiscard]] Res<void> create(const Collection& collection);
    
    [[nodiscard]] Res<std::optional<Collection>> fetch(const Uuid& id);
    [[nodiscard]] Res<std::vector<Collection>> fetch_all();
    [[nodiscard]] Res<std::vector<Collection>> fetch_by_user(const Uuid& user_id);
    [[nodiscard]] Res<std::vector<Collection>> fetch_containing(const Uuid& recipe_id);
    
    [[nodiscard]] Res<Collection> update(const Collection& collection, bool preserve_timestamp = false);
    [[nodiscard]] Res<void> remove(const Uuid& id);
    
    /** Append recipe_id. A recipe that is already a member leaves the collection untouched. */
    [[nodiscard]] Res<Collection> add_recipe(const Uuid& collection_id, const Uuid& recipe_id);
    [[nodiscard]] Res<Collection> remove_recipe(const Uuid& collection_id, const Uuid& recipe_id);
    
    /** Drop recipe_id from every collection holding it. Returns how many changed. */
    [[nodiscard]] Res<int> remove_recipe_from_all(const Uuid& recipe_id);

protected:
    Res<std::optional<LocalSnapshot>> snapshot(storage::Database& db, const Uuid& id) override;
    Res<std::optional<Timestamp>> local_updated_at(storage::Database& db, const Uuid& id) override;
    Res<void> store_remote(storage::Database& db, const RemoteRecord& record) override;
    std::vector<RemoteQuery> pull_queries(const Uuid& owner_id) const override;

private:
    template<typename F>
    [[nodiscard]] Res<Collection> modify(const Uuid& id, F&& change);
};

} // namespace ladle::sync
