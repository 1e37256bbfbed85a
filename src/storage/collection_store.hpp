#pragma once

#include "storage/database.hpp"
#include "core/collection.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace ladle::storage {

/**
 * CollectionStore - Data access layer for recipe collections.
 */
class CollectionStore {
public:
    explicit CollectionStore(Database& db) : db_(db) {}
    
    [[nodiscard]] Result<std::optional<Collection>, Error> get(const Uuid& id);
    
    /** All collections, most recently updated first. */
    [[nodiscard]] Result<std::vector<Collection>, Error> list_all();
    
    [[nodiscard]] Result<std::vector<Collection>, Error> list_by_user(const Uuid& user_id);
    
    /** Collections whose membership list includes recipe_id. */
    [[nodiscard]] Result<std::vector<Collection>, Error> list_containing(const Uuid& recipe_id);
    
    [[nodiscard]] Result<void, Error> save(const Collection& collection);
    
    [[nodiscard]] Result<bool, Error> remove(const Uuid& id);

private:
    Database& db_;
    
    [[nodiscard]] static Result<Collection, Error> row_to_collection(const Statement& stmt);
};

} // namespace ladle::storage
