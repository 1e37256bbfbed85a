#pragma once

#include "core/recipe.hpp"
#include "sync/synced_repository.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ladle::sync {

class CollectionRepository;

/**
 * RecipeRepository - Local-first recipe CRUD with background propagation.
 *
 * create/update/remove return once the local write and the queue entry are
 * committed; remote work happens on the thread pool. Recipes are copied to
 * the public partition while their visibility is public.
 */
class RecipeRepository final : public SyncedRepository {
public:
    explicit RecipeRepository(SyncContext context, ImageSyncManager* images = nullptr);
    ~RecipeRepository() override;
    
    /** Deleted recipes are removed from the collections of this repository. */
    void set_collection_repository(CollectionRepository* collections) { collections_ = collections; }
    
    /** Fails with InvalidData when the id already exists locally. */
    [[nodiscard]] Res<void> create(const Recipe& recipe);
    
    [[nodiscard]] Res<std::optional<Recipe>> fetch(const Uuid& id);
    [[nodiscard]] Res<std::vector<Recipe>> fetch_all();
    [[nodiscard]] Res<std::vector<Recipe>> fetch_by_owner(const Uuid& owner_id);
    [[nodiscard]] Res<std::vector<Recipe>> search(const std::string& title_query);
    
    /**
     * Replace the stored recipe. Unless preserve_timestamp is set, updated_at
     * becomes now (never earlier than the stored value). Returns what was
     * stored. NotFound when the recipe does not exist.
     */
    [[nodiscard]] Res<Recipe> update(const Recipe& recipe, bool preserve_timestamp = false);
    
    /** Delete locally, tombstone the id and schedule the remote delete. */
    [[nodiscard]] Res<void> remove(const Uuid& id);
    
    /** Favorites are local state: stored without a timestamp bump or sync. */
    [[nodiscard]] Res<Recipe> set_favorite(const Uuid& id, bool favorite);

protected:
    Res<std::optional<LocalSnapshot>> snapshot(storage::Database& db, const Uuid& id) override;
    Res<std::optional<Timestamp>> local_updated_at(storage::Database& db, const Uuid& id) override;
    Res<void> store_remote(storage::Database& db, const RemoteRecord& record) override;
    std::vector<RemoteQuery> pull_queries(const Uuid& owner_id) const override;

private:
    CollectionRepository* collections_ = nullptr;
};

} // namespace ladle::sync
