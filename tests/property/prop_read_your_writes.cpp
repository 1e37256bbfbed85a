#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "../sync/sync_harness.hpp"
#include "sync/recipe_repository.hpp"
#include "sync/record_codec.hpp"
#include <set>
#include <vector>

using namespace ladle;
using namespace ladle::sync;

namespace {

rc::Gen<std::string> text() {
    return rc::gen::container<std::string>(rc::gen::inRange<char>(' ', '~'));
}

Recipe arbitraryRecipe(const Uuid& owner) {
    auto recipe = create_recipe(Uuid::generate(), owner, *rc::gen::nonEmpty(text()));
    recipe.ingredients = *rc::gen::container<std::vector<std::string>>(text());
    recipe.steps = *rc::gen::container<std::vector<std::string>>(text());
    recipe.notes = *text();
    recipe.total_minutes = *rc::gen::maybe(rc::gen::inRange(1, 600));
    recipe.visibility = *rc::gen::element(Visibility::Private, Visibility::Public);
    return recipe;
}

} // namespace

TEST_CASE("Property: created recipes read back whether or not the remote is reachable",
          "[property][recipes]") {
    REQUIRE(rc::check("create(x) then fetch(x.id) == x",
        [] {
            InMemoryRemoteStore remote;
            remote.set_available(*rc::gen::arbitrary<bool>());
            test::Device device(remote);
            RecipeRepository recipes(device.context());

            const auto owner = Uuid::generate();
            const auto count = *rc::gen::inRange(1, 6);
            std::vector<Recipe> created;
            for (int i = 0; i < count; ++i) {
                auto recipe = arbitraryRecipe(owner);
                RC_ASSERT(recipes.create(recipe).is_ok());
                created.push_back(recipe);

                auto fetched = recipes.fetch(recipe.id).unwrap();
                RC_ASSERT(fetched.has_value());
                RC_ASSERT(*fetched == recipe);
            }

            recipes.wait_for_background();
            RC_ASSERT(recipes.fetch_by_owner(owner).unwrap().size() == created.size());
            for (const auto& recipe : created) {
                RC_ASSERT(*recipes.fetch(recipe.id).unwrap() == recipe);
            }
        }));
}

TEST_CASE("Property: pulls never bring back deleted recipes", "[property][recipes][tombstones]") {
    REQUIRE(rc::check("deleted ids stay deleted after any pull",
        [] {
            InMemoryRemoteStore remote;
            test::Device device(remote);
            RecipeRepository recipes(device.context());
            const auto owner = Uuid::generate();

            const auto count = *rc::gen::inRange(1, 6);
            std::vector<Recipe> created;
            for (int i = 0; i < count; ++i) {
                auto recipe = arbitraryRecipe(owner);
                RC_ASSERT(recipes.create(recipe).is_ok());
                created.push_back(recipe);
            }
            recipes.wait_for_background();

            std::set<Uuid> deleted;
            for (const auto& recipe : created) {
                if (*rc::gen::arbitrary<bool>()) {
                    RC_ASSERT(recipes.remove(recipe.id).is_ok());
                    deleted.insert(recipe.id);
                }
            }
            recipes.wait_for_background();

            // Stale copies of everything reappear remotely.
            for (const auto& recipe : created) {
                remote.put_record(Partition::Private, to_record(recipe));
            }

            auto summary = recipes.sync_from_remote(owner).unwrap();
            RC_ASSERT(summary.skipped_tombstoned == static_cast<int>(deleted.size()));
            for (const auto& recipe : created) {
                const bool present = recipes.fetch(recipe.id).unwrap().has_value();
                RC_ASSERT(present == (deleted.count(recipe.id) == 0));
            }
        }));
}
