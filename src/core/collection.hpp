#pragma once

#include "core/types.hpp"
#include "core/visibility.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace ladle {

/**
 * Collection - A user-curated, ordered list of recipes.
 */
struct Collection {
    Uuid id;
    std::string name;
    std::string description;
    Uuid user_id;
    std::vector<Uuid> recipe_ids;
    Visibility visibility{Visibility::Private};
    std::optional<std::string> emoji;
    std::optional<std::string> color;  // Hex, e.g. "#FF5733"
    std::optional<std::string> cover_image_filename;
    Timestamp created_at;
    Timestamp updated_at;
    
    bool operator==(const Collection&) const = default;
};

[[nodiscard]] inline Collection create_collection(Uuid id, Uuid user_id, std::string name) {
    auto now = Timestamp::now();
    return Collection{
        .id = id,
        .name = std::move(name),
        .user_id = user_id,
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline bool contains_recipe(const Collection& c, const Uuid& recipe_id) {
    return std::find(c.recipe_ids.begin(), c.recipe_ids.end(), recipe_id) != c.recipe_ids.end();
}

/**
 * Append a recipe. Adding an existing member is a no-op.
 */
[[nodiscard]] inline Collection with_recipe_added(Collection c, const Uuid& recipe_id) {
    if (contains_recipe(c, recipe_id)) return c;
    c.recipe_ids.push_back(recipe_id);
    c.updated_at = Timestamp::now();
    return c;
}

[[nodiscard]] inline Collection with_recipe_removed(Collection c, const Uuid& recipe_id) {
    auto it = std::remove(c.recipe_ids.begin(), c.recipe_ids.end(), recipe_id);
    if (it == c.recipe_ids.end()) return c;
    c.recipe_ids.erase(it, c.recipe_ids.end());
    c.updated_at = Timestamp::now();
    return c;
}

} // namespace ladle
