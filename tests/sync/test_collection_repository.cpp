#include <catch2/catch_test_macros.hpp>

#include "sync/collection_repository.hpp"
#include "sync/record_codec.hpp"
#include "sync_harness.hpp"

using namespace ladle;
using namespace ladle::sync;

namespace {

const std::string kCollectionType = "Collection";

} // namespace

TEST_CASE("CollectionRepository: CRUD", "[sync][collections]") {
    InMemoryRemoteStore remote;
    test::Device device(remote);
    test::EventLog events(device.events());
    CollectionRepository collections(device.context());
    const auto user = Uuid::generate();

    auto collection = create_collection(Uuid::generate(), user, "Weeknight");
    collection.description = "Quick dinners";
    collection.emoji = "🍝";
    collection.color = "#FF5733";
    REQUIRE(collections.create(collection).is_ok());
    REQUIRE(*collections.fetch(collection.id).unwrap() == collection);
    REQUIRE(events.count("created", collection.id) == 1);
    collections.wait_for_background();

    SECTION("create pushes to the private partition") {
        auto stored = remote.record(Partition::Private, kCollectionType, collection.id.to_string());
        REQUIRE(stored.has_value());
        REQUIRE(collection_from_record(*stored).unwrap() == collection);
        REQUIRE_FALSE(remote.record(Partition::Public, kCollectionType, collection.id.to_string()).has_value());
    }

    SECTION("duplicate ids are rejected") {
        REQUIRE(collections.create(collection).unwrap_err().kind == ErrorKind::InvalidData);
    }

    SECTION("queries") {
        const auto recipe = Uuid::generate();
        auto other = create_collection(Uuid::generate(), Uuid::generate(), "Someone else's");
        REQUIRE(collections.create(other).is_ok());
        REQUIRE(collections.add_recipe(other.id, recipe).is_ok());

        REQUIRE(collections.fetch_all().unwrap().size() == 2);
        REQUIRE(collections.fetch_by_user(user).unwrap().size() == 1);
        auto holders = collections.fetch_containing(recipe).unwrap();
        REQUIRE(holders.size() == 1);
        REQUIRE(holders[0].id == other.id);
        collections.wait_for_background();
    }

    SECTION("update bumps the timestamp and pushes") {
        auto edited = collection;
        edited.name = "Weekend";
        auto stored = collections.update(edited).unwrap();
        REQUIRE(stored.updated_at >= collection.updated_at);
        REQUIRE(collections.fetch(collection.id).unwrap()->name == "Weekend");
        collections.wait_for_background();

        auto remoteCopy = remote.record(Partition::Private, kCollectionType, collection.id.to_string());
        REQUIRE(collection_from_record(*remoteCopy).unwrap().name == "Weekend");
    }

    SECTION("public collections are replicated and withdrawn") {
        auto shared = collection;
        shared.visibility = Visibility::Public;
        REQUIRE(collections.update(shared).is_ok());
        collections.wait_for_background();
        REQUIRE(remote.record(Partition::Public, kCollectionType, collection.id.to_string()).has_value());

        auto current = *collections.fetch(collection.id).unwrap();
        current.visibility = Visibility::Private;
        REQUIRE(collections.update(current).is_ok());
        collections.wait_for_background();
        REQUIRE_FALSE(remote.record(Partition::Public, kCollectionType, collection.id.to_string()).has_value());
    }

    SECTION("remove tombstones and deletes remotely") {
        REQUIRE(collections.remove(collection.id).is_ok());
        REQUIRE_FALSE(collections.fetch(collection.id).unwrap().has_value());
        REQUIRE(device.isTombstoned(collection.id));
        collections.wait_for_background();
        REQUIRE(remote.record_count(Partition::Private) == 0);
        REQUIRE(collections.remove(collection.id).unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("unknown collections are not found") {
        REQUIRE(collections.update(create_collection(Uuid::generate(), user, "x")).unwrap_err().kind ==
                ErrorKind::NotFound);
        REQUIRE(collections.add_recipe(Uuid::generate(), Uuid::generate()).unwrap_err().kind ==
                ErrorKind::NotFound);
    }
}

TEST_CASE("CollectionRepository: recipe membership", "[sync][collections]") {
    InMemoryRemoteStore remote;
    test::Device device(remote);
    CollectionRepository collections(device.context());
    const auto user = Uuid::generate();
    const auto soup = Uuid::generate();
    const auto salad = Uuid::generate();

    auto collection = create_collection(Uuid::generate(), user, "Lunch");
    REQUIRE(collections.create(collection).is_ok());
    collections.wait_for_background();

    SECTION("adding keeps insertion order and pushes the change") {
        REQUIRE(collections.add_recipe(collection.id, soup).is_ok());
        auto stored = collections.add_recipe(collection.id, salad).unwrap();
        REQUIRE(stored.recipe_ids == std::vector<Uuid>{soup, salad});
        REQUIRE(stored.updated_at >= collection.updated_at);
        collections.wait_for_background();

        auto remoteCopy = remote.record(Partition::Private, kCollectionType, collection.id.to_string());
        REQUIRE(collection_from_record(*remoteCopy).unwrap().recipe_ids == std::vector<Uuid>{soup, salad});
    }

    SECTION("adding a member twice changes nothing") {
        auto first = collections.add_recipe(collection.id, soup).unwrap();
        collections.wait_for_background();
        const auto opsBefore = device.operations();

        auto second = collections.add_recipe(collection.id, soup).unwrap();
        REQUIRE(second == first);
        REQUIRE(device.operations() == opsBefore);
        REQUIRE(collections.pending_count() == 0);
    }

    SECTION("removing a member") {
        REQUIRE(collections.add_recipe(collection.id, soup).is_ok());
        REQUIRE(collections.add_recipe(collection.id, salad).is_ok());
        auto stored = collections.remove_recipe(collection.id, soup).unwrap();
        REQUIRE(stored.recipe_ids == std::vector<Uuid>{salad});

        auto unchanged = collections.remove_recipe(collection.id, soup).unwrap();
        REQUIRE(unchanged == stored);
        collections.wait_for_background();
    }

    SECTION("remove_recipe_from_all touches only holders") {
        auto other = create_collection(Uuid::generate(), user, "Dinner");
        auto third = create_collection(Uuid::generate(), user, "Snacks");
        REQUIRE(collections.create(other).is_ok());
        REQUIRE(collections.create(third).is_ok());
        REQUIRE(collections.add_recipe(collection.id, soup).is_ok());
        REQUIRE(collections.add_recipe(other.id, soup).is_ok());
        REQUIRE(collections.add_recipe(other.id, salad).is_ok());

        REQUIRE(collections.remove_recipe_from_all(soup).unwrap() == 2);
        REQUIRE(collections.fetch(collection.id).unwrap()->recipe_ids.empty());
        REQUIRE(collections.fetch(other.id).unwrap()->recipe_ids == std::vector<Uuid>{salad});
        REQUIRE(collections.fetch_containing(soup).unwrap().empty());
        REQUIRE(collections.remove_recipe_from_all(soup).unwrap() == 0);
        collections.wait_for_background();
    }
}

TEST_CASE("CollectionRepository: cover images", "[sync][collections][images]") {
    InMemoryRemoteStore remote;
    test::Device device(remote);
    auto images = device.makeImages(ImageConfig::collection(), kCollectionType);
    CollectionRepository collections(device.context(), images.get());
    const auto user = Uuid::generate();

    auto collection = create_collection(Uuid::generate(), user, "Baking");
    collection.cover_image_filename =
        images->save_image(collection.id, test::makeTestImage(50, 50)).unwrap().toStdString();
    REQUIRE(collections.create(collection).is_ok());
    collections.wait_for_background();

    const auto assetId = asset_id_for(kCollectionType, collection.id);
    REQUIRE(assetId == "CollectionImage-" + collection.id.to_string());
    REQUIRE(remote.asset(Partition::Private, assetId) == images->load_image_data(collection.id).unwrap());

    auto current = *collections.fetch(collection.id).unwrap();
    current.cover_image_filename.reset();
    REQUIRE(collections.update(current).is_ok());
    REQUIRE_FALSE(images->image_exists(collection.id));
    collections.wait_for_background();
    REQUIRE_FALSE(remote.asset(Partition::Private, assetId).has_value());
}

TEST_CASE("CollectionRepository: pull", "[sync][collections]") {
    InMemoryRemoteStore remote;
    test::Device device(remote);
    CollectionRepository collections(device.context());
    const auto user = Uuid::generate();

    auto mine = create_collection(Uuid::generate(), user, "Mine");
    mine.recipe_ids = {Uuid::generate(), Uuid::generate()};
    remote.put_record(Partition::Private, to_record(mine));
    remote.put_record(Partition::Private, to_record(create_collection(Uuid::generate(), Uuid::generate(), "Theirs")));

    auto summary = collections.sync_from_remote(user).unwrap();
    REQUIRE(summary.inserted == 1);
    REQUIRE(*collections.fetch(mine.id).unwrap() == mine);
    REQUIRE(collections.fetch_all().unwrap().size() == 1);
}
