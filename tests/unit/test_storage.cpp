#include <catch2/catch_test_macros.hpp>
#include "storage/collection_store.hpp"
#include "storage/connection_store.hpp"
#include "storage/database.hpp"
#include "storage/json_columns.hpp"
#include "storage/migrations.hpp"
#include "storage/recipe_store.hpp"
#include "storage/remote_state_store.hpp"
#include "storage/user_store.hpp"

using namespace ladle;
using namespace ladle::storage;

namespace {

Database migrated_database() {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    return db;
}

Recipe recipe_at(const Uuid& owner, std::string title, int64_t updated_millis) {
    auto recipe = create_recipe(Uuid::generate(), owner, std::move(title));
    recipe.created_at = Timestamp(updated_millis);
    recipe.updated_at = Timestamp(updated_millis);
    return recipe;
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db = Database::open_memory().unwrap();

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.run("INSERT INTO test VALUES (?, ?);", 1, std::string("Basil")).unwrap() == 1);
        REQUIRE(db.run("INSERT INTO test VALUES (?, ?);", 2, std::string("Thyme")).unwrap() == 1);

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Basil");
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_text(1) == "Thyme");
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction rolls back on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Res<void> {
            auto inserted = db.run("INSERT INTO test VALUES (1);");
            if (inserted.is_err()) return Res<void>::err(inserted.unwrap_err());
            return Res<void>::err(Error{ErrorKind::Internal, "abort"});
        });
        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 0);
    }

    SECTION("Invalid SQL reports a storage error") {
        auto result = db.execute("SELEKT 1;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
    }
}

TEST_CASE("Migrations", "[storage][migrations]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());

    SECTION("Migrating twice is a no-op") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Rollback removes the newest tables") {
        REQUIRE(runner.rollback_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute("SELECT COUNT(*) FROM tombstones;").is_err());
        REQUIRE(db.execute("SELECT COUNT(*) FROM recipes;").is_ok());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.execute("SELECT COUNT(*) FROM remote_sync_state;").is_ok());
    }
}

TEST_CASE("List columns", "[storage][json]") {
    REQUIRE(encode_string_list({}) == "[]");
    auto decoded = decode_string_list(encode_string_list({"2 eggs", "1 \"ripe\" tomato"}));
    REQUIRE(decoded.unwrap() == std::vector<std::string>{"2 eggs", "1 \"ripe\" tomato"});

    REQUIRE(decode_string_list("{not json").unwrap_err().kind == ErrorKind::InvalidData);
    REQUIRE(decode_string_list("[1, 2]").unwrap_err().kind == ErrorKind::InvalidData);
    REQUIRE(decode_uuid_list("[\"nope\"]").unwrap_err().kind == ErrorKind::InvalidData);
}

TEST_CASE("RecipeStore", "[storage][recipe]") {
    auto db = migrated_database();
    RecipeStore store(db);
    const auto owner = Uuid::generate();

    SECTION("Save and load every field") {
        auto recipe = recipe_at(owner, "Pho", 1000);
        recipe.ingredients = {"star anise", "beef bones"};
        recipe.steps = {"Char the onion", "Simmer 6h"};
        recipe.tags = {"soup"};
        recipe.yields = "4 bowls";
        recipe.total_minutes = 400;
        recipe.notes = "Skim often";
        recipe.source_url = "https://example.org/pho";
        recipe.image_filename = recipe.id.to_string() + ".jpg";
        recipe.is_favorite = true;
        recipe.visibility = Visibility::Public;

        REQUIRE(store.save(recipe).is_ok());
        auto loaded = store.get(recipe.id).unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == recipe);
    }

    SECTION("Missing id is empty, not an error") {
        auto loaded = store.get(Uuid::generate());
        REQUIRE(loaded.is_ok());
        REQUIRE_FALSE(loaded.unwrap().has_value());
    }

    SECTION("Save replaces the stored row") {
        auto recipe = recipe_at(owner, "Dal", 1000);
        REQUIRE(store.save(recipe).is_ok());
        recipe.title = "Dal tadka";
        recipe.total_minutes.reset();
        REQUIRE(store.save(recipe).is_ok());
        REQUIRE(store.get(recipe.id).unwrap()->title == "Dal tadka");
        REQUIRE(store.count().unwrap() == 1);
    }

    SECTION("Lists are ordered by updated_at descending") {
        auto oldest = recipe_at(owner, "Bread", 1000);
        auto newest = recipe_at(owner, "Brownies", 3000);
        auto middle = recipe_at(Uuid::generate(), "Bagels", 2000);
        REQUIRE(store.save(oldest).is_ok());
        REQUIRE(store.save(newest).is_ok());
        REQUIRE(store.save(middle).is_ok());

        auto all = store.list_all().unwrap();
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].id == newest.id);
        REQUIRE(all[1].id == middle.id);
        REQUIRE(all[2].id == oldest.id);

        auto mine = store.list_by_owner(owner).unwrap();
        REQUIRE(mine.size() == 2);
        REQUIRE(mine[0].id == newest.id);

        auto found = store.search_by_title("bRo").unwrap();
        REQUIRE(found.size() == 1);
        REQUIRE(found[0].id == newest.id);
    }

    SECTION("Remove reports whether a row existed") {
        auto recipe = recipe_at(owner, "Flan", 1000);
        REQUIRE(store.save(recipe).is_ok());
        REQUIRE(store.remove(recipe.id).unwrap());
        REQUIRE_FALSE(store.remove(recipe.id).unwrap());
    }

    SECTION("Unknown visibility decodes as private") {
        auto recipe = recipe_at(owner, "Mole", 1000);
        recipe.visibility = Visibility::Public;
        REQUIRE(store.save(recipe).is_ok());
        REQUIRE(db.run("UPDATE recipes SET visibility = 'friends' WHERE id = ?;", recipe.id.to_string()).is_ok());
        REQUIRE(store.get(recipe.id).unwrap()->visibility == Visibility::Private);
    }
}

TEST_CASE("CollectionStore", "[storage][collection]") {
    auto db = migrated_database();
    CollectionStore store(db);
    const auto user = Uuid::generate();
    const auto soup = Uuid::generate();
    const auto salad = Uuid::generate();

    auto weeknight = create_collection(Uuid::generate(), user, "Weeknight");
    weeknight.recipe_ids = {soup, salad};
    weeknight.emoji = "🍲";
    weeknight.color = "#FF5733";
    auto summer = create_collection(Uuid::generate(), Uuid::generate(), "Summer");
    summer.recipe_ids = {salad};

    REQUIRE(store.save(weeknight).is_ok());
    REQUIRE(store.save(summer).is_ok());

    REQUIRE(*store.get(weeknight.id).unwrap() == weeknight);
    REQUIRE(store.list_by_user(user).unwrap().size() == 1);
    REQUIRE(store.list_containing(salad).unwrap().size() == 2);
    REQUIRE(store.list_containing(soup).unwrap().size() == 1);
    REQUIRE(store.list_containing(Uuid::generate()).unwrap().empty());
    REQUIRE(store.list_all().unwrap().size() == 2);
}

TEST_CASE("ConnectionStore", "[storage][connection]") {
    auto db = migrated_database();
    ConnectionStore store(db);
    const auto ana = Uuid::generate();
    const auto ben = Uuid::generate();
    const auto cy = Uuid::generate();

    auto ana_ben = create_connection_request(Uuid::generate(), ana, ben);
    ana_ben.from_username = "ana";
    ana_ben.to_display_name = "Ben B.";
    auto cy_ana = accepted(create_connection_request(Uuid::generate(), cy, ana));
    REQUIRE(store.save(ana_ben).is_ok());
    REQUIRE(store.save(cy_ana).is_ok());

    REQUIRE(*store.get(ana_ben.id).unwrap() == ana_ben);
    REQUIRE(store.list_for_user(ana).unwrap().size() == 2);
    REQUIRE(store.list_accepted(ana).unwrap().size() == 1);
    REQUIRE(store.list_sent_requests(ana).unwrap().size() == 1);
    REQUIRE(store.list_received_requests(ben).unwrap().size() == 1);
    REQUIRE(store.list_received_requests(ana).unwrap().empty());

    SECTION("find_between ignores direction") {
        REQUIRE(store.find_between(ben, ana).unwrap()->id == ana_ben.id);
        REQUIRE_FALSE(store.find_between(ben, cy).unwrap().has_value());
    }

    SECTION("Legacy statuses decode as pending") {
        REQUIRE(db.run("UPDATE connections SET status = 'blocked' WHERE id = ?;", cy_ana.id.to_string()).is_ok());
        REQUIRE(store.get(cy_ana.id).unwrap()->status == ConnectionStatus::Pending);
    }
}

TEST_CASE("UserStore", "[storage][user]") {
    auto db = migrated_database();
    UserStore store(db);

    auto user = create_user(Uuid::generate(), "MarcoP", "Marco");
    user.email = "marco@example.org";
    user.profile_emoji = "👨‍🍳";
    REQUIRE(store.save(user).is_ok());

    REQUIRE(*store.get(user.id).unwrap() == user);
    REQUIRE(store.find_by_username("marcop").unwrap()->id == user.id);
    REQUIRE_FALSE(store.find_by_username("nobody").unwrap().has_value());
    REQUIRE(store.remove(user.id).unwrap());
    REQUIRE(store.list_all().unwrap().empty());
}

TEST_CASE("RemoteStateStore", "[storage][remote_state]") {
    auto db = migrated_database();
    RemoteStateStore store(db);
    const auto id = Uuid::generate();

    auto fresh = store.get_or_default(EntityKind::Recipe, id).unwrap();
    REQUIRE(fresh.entity_id == id);
    REQUIRE(fresh.entity_kind == EntityKind::Recipe);
    REQUIRE_FALSE(fresh.remote_record_id.has_value());
    REQUIRE_FALSE(store.get(EntityKind::Recipe, id).unwrap().has_value());

    fresh.remote_record_id = id.to_string();
    fresh.public_record_id = id.to_string();
    fresh.remote_asset_modified_at = Timestamp(5000);
    REQUIRE(store.save(fresh).is_ok());
    REQUIRE(*store.get(EntityKind::Recipe, id).unwrap() == fresh);

    // Same id under another kind is a separate row.
    REQUIRE_FALSE(store.get(EntityKind::Collection, id).unwrap().has_value());

    fresh.public_record_id.reset();
    REQUIRE(store.save(fresh).is_ok());
    REQUIRE_FALSE(store.get(EntityKind::Recipe, id).unwrap()->public_record_id.has_value());

    REQUIRE(store.list(EntityKind::Recipe).unwrap().size() == 1);
    REQUIRE(store.remove(EntityKind::Recipe, id).unwrap());
    REQUIRE(store.list(EntityKind::Recipe).unwrap().empty());
}
