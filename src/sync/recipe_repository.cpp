#include "sync/recipe_repository.hpp"
#include "storage/recipe_store.hpp"
#include "sync/collection_repository.hpp"
#include "sync/record_codec.hpp"

#include <algorithm>

namespace ladle::sync {

namespace {

Error recipe_not_found(const Uuid& id) {
    return Error{ErrorKind::NotFound, "Recipe " + id.to_string() + " not found"};
}

} // namespace

RecipeRepository::RecipeRepository(SyncContext context, ImageSyncManager* images)
    : SyncedRepository(EntityKind::Recipe, context, images)
{
}

RecipeRepository::~RecipeRepository() {
    wait_for_background();
}

Res<void> RecipeRepository::create(const Recipe& recipe) {
    auto created = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<void> {
            storage::RecipeStore store(db);
            auto existing = store.get(recipe.id);
            if (existing.is_err()) return Res<void>::err(existing.unwrap_err());
            if (existing.unwrap()) {
                return Res<void>::err(Error{ErrorKind::InvalidData,
                                            "Recipe " + recipe.id.to_string() + " already exists"});
            }
            
            auto saved = store.save(recipe);
            if (saved.is_err()) return saved;
            return record_create(db, recipe.id);
        });
    });
    if (created.is_err()) {
        return created;
    }
    
    after_create(recipe.id, recipe.image_filename.has_value());
    return created;
}

Res<std::optional<Recipe>> RecipeRepository::fetch(const Uuid& id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::RecipeStore(db).get(id);
    });
}

Res<std::vector<Recipe>> RecipeRepository::fetch_all() {
    return context().local.with_db([](storage::Database& db) {
        return storage::RecipeStore(db).list_all();
    });
}

Res<std::vector<Recipe>> RecipeRepository::fetch_by_owner(const Uuid& owner_id) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::RecipeStore(db).list_by_owner(owner_id);
    });
}

Res<std::vector<Recipe>> RecipeRepository::search(const std::string& title_query) {
    return context().local.with_db([&](storage::Database& db) {
        return storage::RecipeStore(db).search_by_title(title_query);
    });
}

Res<Recipe> RecipeRepository::update(const Recipe& recipe, bool preserve_timestamp) {
    struct Applied {
        Recipe before;
        Recipe stored;
        bool needs_upload{false};
    };
    
    auto applied = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<Applied> {
            storage::RecipeStore store(db);
            auto existing = store.get(recipe.id);
            if (existing.is_err()) return Res<Applied>::err(existing.unwrap_err());
            if (!existing.unwrap()) return Res<Applied>::err(recipe_not_found(recipe.id));
            
            Applied result{.before = *existing.unwrap(), .stored = recipe};
            if (!preserve_timestamp) {
                result.stored.updated_at = std::max(Timestamp::now(), result.before.updated_at);
            }
            
            auto saved = store.save(result.stored);
            if (saved.is_err()) return Res<Applied>::err(saved.unwrap_err());
            auto queued = record_update(db, recipe.id);
            if (queued.is_err()) return Res<Applied>::err(queued.unwrap_err());
            
            if (result.stored.image_filename) {
                auto stale = image_needs_upload(db, recipe.id);
                if (stale.is_err()) return Res<Applied>::err(stale.unwrap_err());
                result.needs_upload = stale.unwrap();
            }
            return Res<Applied>::ok(std::move(result));
        });
    });
    if (applied.is_err()) {
        return Res<Recipe>::err(applied.unwrap_err());
    }
    
    const auto& change = applied.unwrap();
    after_update(recipe.id, change.before.visibility, change.stored.visibility,
                 change.before.image_filename.has_value() && !change.stored.image_filename.has_value(),
                 change.needs_upload);
    return Res<Recipe>::ok(change.stored);
}

Res<void> RecipeRepository::remove(const Uuid& id) {
    auto removed = context().local.with_db([&](storage::Database& db) {
        return db.transaction([&]() -> Res<bool> {
            storage::RecipeStore store(db);
            auto existing = store.get(id);
            if (existing.is_err()) return Res<bool>::err(existing.unwrap_err());
            if (!existing.unwrap()) return Res<bool>::err(recipe_not_found(id));
            
            auto deleted = store.remove(id);
            if (deleted.is_err()) return Res<bool>::err(deleted.unwrap_err());
            auto recorded = record_delete(db, id);
            if (recorded.is_err()) return Res<bool>::err(recorded.unwrap_err());
            return Res<bool>::ok(existing.unwrap()->image_filename.has_value());
        });
    });
    if (removed.is_err()) {
        return Res<void>::err(removed.unwrap_err());
    }
    
    after_delete(id, removed.unwrap());
    
    if (collections_) {
        auto detached = collections_->remove_recipe_from_all(id);
        if (detached.is_err()) {
            return Res<void>::err(detached.unwrap_err());
        }
    }
    return Res<void>::ok();
}

Res<Recipe> RecipeRepository::set_favorite(const Uuid& id, bool favorite) {
    return context().local.with_db([&](storage::Database& db) -> Res<Recipe> {
        storage::RecipeStore store(db);
        auto existing = store.get(id);
        if (existing.is_err()) return Res<Recipe>::err(existing.unwrap_err());
        if (!existing.unwrap()) return Res<Recipe>::err(recipe_not_found(id));
        
        auto updated = with_favorite(*existing.unwrap(), favorite);
        auto saved = store.save(updated);
        if (saved.is_err()) return Res<Recipe>::err(saved.unwrap_err());
        return Res<Recipe>::ok(std::move(updated));
    });
}

Res<std::optional<LocalSnapshot>> RecipeRepository::snapshot(storage::Database& db, const Uuid& id) {
    return storage::RecipeStore(db).get(id).map([](const std::optional<Recipe>& recipe) {
        std::optional<LocalSnapshot> snap;
        if (recipe) {
            snap = LocalSnapshot{
                .record = to_record(*recipe),
                .visibility = recipe->visibility,
                .replicate_public = recipe->visibility == Visibility::Public,
                .has_image = recipe->image_filename.has_value()
            };
        }
        return snap;
    });
}

Res<std::optional<Timestamp>> RecipeRepository::local_updated_at(storage::Database& db, const Uuid& id) {
    return storage::RecipeStore(db).get(id).map([](const std::optional<Recipe>& recipe) {
        return recipe ? std::optional<Timestamp>(recipe->updated_at) : std::nullopt;
    });
}

Res<void> RecipeRepository::store_remote(storage::Database& db, const RemoteRecord& record) {
    auto decoded = recipe_from_record(record);
    if (decoded.is_err()) {
        return Res<void>::err(decoded.unwrap_err());
    }
    auto recipe = std::move(decoded).unwrap();
    
    storage::RecipeStore store(db);
    auto existing = store.get(recipe.id);
    if (existing.is_err()) {
        return Res<void>::err(existing.unwrap_err());
    }
    if (existing.unwrap()) {
        recipe.is_favorite = existing.unwrap()->is_favorite;
    }
    return store.save(recipe);
}

std::vector<RemoteQuery> RecipeRepository::pull_queries(const Uuid& owner_id) const {
    return {RemoteQuery{.partition = Partition::Private, .match = FieldMatch{"owner_id", owner_id.to_string()}}};
}

} // namespace ladle::sync
