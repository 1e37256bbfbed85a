#pragma once

#include "core/types.hpp"
#include "core/visibility.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ladle {

/**
 * Recipe - A fully assembled recipe as stored on this device.
 *
 * Remote identifiers are not part of the payload; they live in
 * RemoteSyncState keyed by the recipe id.
 */
struct Recipe {
    Uuid id;
    std::string title;
    std::vector<std::string> ingredients;
    std::vector<std::string> steps;
    std::vector<std::string> tags;
    std::string yields;
    std::optional<int> total_minutes;
    std::string notes;
    std::string source_url;
    std::optional<std::string> image_filename;
    bool is_favorite{false};  // Local preference, never taken from a remote copy
    Visibility visibility{Visibility::Private};
    Uuid owner_id;
    Timestamp created_at;
    Timestamp updated_at;
    
    bool operator==(const Recipe&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a new private recipe.
 */
[[nodiscard]] inline Recipe create_recipe(Uuid id, Uuid owner_id, std::string title) {
    auto now = Timestamp::now();
    return Recipe{
        .id = id,
        .title = std::move(title),
        .owner_id = owner_id,
        .created_at = now,
        .updated_at = now
    };
}

[[nodiscard]] inline Recipe with_title(Recipe recipe, std::string title) {
    recipe.title = std::move(title);
    recipe.updated_at = Timestamp::now();
    return recipe;
}

[[nodiscard]] inline Recipe with_visibility(Recipe recipe, Visibility visibility) {
    recipe.visibility = visibility;
    recipe.updated_at = Timestamp::now();
    return recipe;
}

[[nodiscard]] inline Recipe with_image(Recipe recipe, std::optional<std::string> filename) {
    recipe.image_filename = std::move(filename);
    recipe.updated_at = Timestamp::now();
    return recipe;
}

/**
 * Toggle the favorite flag. Does not bump updated_at: favorites are local
 * state and must not win a last-write-wins comparison.
 */
[[nodiscard]] inline Recipe with_favorite(Recipe recipe, bool favorite) {
    recipe.is_favorite = favorite;
    return recipe;
}

} // namespace ladle
