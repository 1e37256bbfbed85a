#pragma once

#include "storage/database.hpp"
#include "core/recipe.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace ladle::storage {

/**
 * RecipeStore - Data access layer for recipes.
 */
class RecipeStore {
public:
    explicit RecipeStore(Database& db) : db_(db) {}
    
    /** Get a recipe by ID. */
    [[nodiscard]] Result<std::optional<Recipe>, Error> get(const Uuid& id);
    
    /** All recipes, most recently updated first. */
    [[nodiscard]] Result<std::vector<Recipe>, Error> list_all();
    
    [[nodiscard]] Result<std::vector<Recipe>, Error> list_by_owner(const Uuid& owner_id);
    
    /** Case-insensitive substring match on title, most recently updated first. */
    [[nodiscard]] Result<std::vector<Recipe>, Error> search_by_title(const std::string& query);
    
    /** Insert or replace the stored row for recipe.id. */
    [[nodiscard]] Result<void, Error> save(const Recipe& recipe);
    
    /** Delete a recipe. Returns whether a row was removed. */
    [[nodiscard]] Result<bool, Error> remove(const Uuid& id);
    
    [[nodiscard]] Result<int, Error> count();

private:
    Database& db_;
    
    [[nodiscard]] static Result<Recipe, Error> row_to_recipe(const Statement& stmt);
};

} // namespace ladle::storage
