#include "storage/recipe_store.hpp"
#include "storage/json_columns.hpp"
#include "storage/rows.hpp"

namespace ladle::storage {

namespace {

constexpr const char* kSelectRecipe = R"SQL(
    SELECT id, title, ingredients_json, steps_json, tags_json, yields,
           total_minutes, notes, source_url, image_filename, is_favorite,
           visibility, owner_id, created_at, updated_at
    FROM recipes )SQL";

} // namespace

Result<Recipe, Error> RecipeStore::row_to_recipe(const Statement& stmt) {
    auto id = column_uuid(stmt, 0);
    if (id.is_err()) return Result<Recipe, Error>::err(id.unwrap_err());
    auto owner_id = column_uuid(stmt, 12);
    if (owner_id.is_err()) return Result<Recipe, Error>::err(owner_id.unwrap_err());
    
    auto ingredients = decode_string_list(stmt.column_text(2));
    if (ingredients.is_err()) return Result<Recipe, Error>::err(ingredients.unwrap_err());
    auto steps = decode_string_list(stmt.column_text(3));
    if (steps.is_err()) return Result<Recipe, Error>::err(steps.unwrap_err());
    auto tags = decode_string_list(stmt.column_text(4));
    if (tags.is_err()) return Result<Recipe, Error>::err(tags.unwrap_err());
    
    std::optional<int> total_minutes;
    if (!stmt.column_is_null(6)) {
        total_minutes = stmt.column_int(6);
    }
    
    return Result<Recipe, Error>::ok(Recipe{
        .id = id.unwrap(),
        .title = stmt.column_text(1),
        .ingredients = std::move(ingredients).unwrap(),
        .steps = std::move(steps).unwrap(),
        .tags = std::move(tags).unwrap(),
        .yields = stmt.column_text(5),
        .total_minutes = total_minutes,
        .notes = stmt.column_text(7),
        .source_url = stmt.column_text(8),
        .image_filename = stmt.column_optional_text(9),
        .is_favorite = stmt.column_int(10) != 0,
        .visibility = visibility_from_string(stmt.column_text(11)),
        .owner_id = owner_id.unwrap(),
        .created_at = Timestamp(stmt.column_int64(13)),
        .updated_at = Timestamp(stmt.column_int64(14))
    });
}

Result<std::optional<Recipe>, Error> RecipeStore::get(const Uuid& id) {
    return select_one<Recipe>(db_, std::string(kSelectRecipe) + "WHERE id = ?;",
                              row_to_recipe, id.to_string());
}

Result<std::vector<Recipe>, Error> RecipeStore::list_all() {
    return select_rows<Recipe>(db_, std::string(kSelectRecipe) + "ORDER BY updated_at DESC;",
                               row_to_recipe);
}

Result<std::vector<Recipe>, Error> RecipeStore::list_by_owner(const Uuid& owner_id) {
    return select_rows<Recipe>(
        db_, std::string(kSelectRecipe) + "WHERE owner_id = ? ORDER BY updated_at DESC;",
        row_to_recipe, owner_id.to_string());
}

Result<std::vector<Recipe>, Error> RecipeStore::search_by_title(const std::string& query) {
    return select_rows<Recipe>(
        db_, std::string(kSelectRecipe) + "WHERE title LIKE ? ORDER BY updated_at DESC;",
        row_to_recipe, "%" + query + "%");
}

Result<void, Error> RecipeStore::save(const Recipe& recipe) {
    std::optional<int64_t> total_minutes;
    if (recipe.total_minutes) {
        total_minutes = *recipe.total_minutes;
    }
    
    auto result = db_.run(R"SQL(
        INSERT INTO recipes (id, title, ingredients_json, steps_json, tags_json, yields,
                             total_minutes, notes, source_url, image_filename, is_favorite,
                             visibility, owner_id, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            title = excluded.title,
            ingredients_json = excluded.ingredients_json,
            steps_json = excluded.steps_json,
            tags_json = excluded.tags_json,
            yields = excluded.yields,
            total_minutes = excluded.total_minutes,
            notes = excluded.notes,
            source_url = excluded.source_url,
            image_filename = excluded.image_filename,
            is_favorite = excluded.is_favorite,
            visibility = excluded.visibility,
            owner_id = excluded.owner_id,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at;
    )SQL",
        recipe.id.to_string(),
        recipe.title,
        encode_string_list(recipe.ingredients),
        encode_string_list(recipe.steps),
        encode_string_list(recipe.tags),
        recipe.yields,
        total_minutes,
        recipe.notes,
        recipe.source_url,
        recipe.image_filename,
        recipe.is_favorite,
        to_string(recipe.visibility),
        recipe.owner_id.to_string(),
        recipe.created_at.millis(),
        recipe.updated_at.millis());
    
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> RecipeStore::remove(const Uuid& id) {
    return db_.run("DELETE FROM recipes WHERE id = ?;", id.to_string())
        .map([](int changed) { return changed > 0; });
}

Result<int, Error> RecipeStore::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM recipes;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    
    return Result<int, Error>::ok(stmt.column_int(0));
}

} // namespace ladle::storage
