#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/tombstone_store.hpp"
#include "sync/local_store.hpp"
#include <chrono>
#include <vector>

using namespace ladle;
using namespace ladle::storage;

namespace {

constexpr std::chrono::milliseconds kRetention = std::chrono::days(30);

} // namespace

TEST_CASE("Property: cleanup removes exactly the expired tombstones", "[property][tombstones]") {
    REQUIRE(rc::check("a tombstone survives cleanup iff it is younger than the retention",
        [] {
            const auto ages = *rc::gen::container<std::vector<int64_t>>(
                rc::gen::inRange<int64_t>(0, 60LL * 24 * 60 * 60 * 1000));
            const Timestamp now(1'800'000'000'000);

            auto local = sync::LocalStore::open_memory().unwrap();
            std::vector<Uuid> ids;
            int expired = 0;
            for (auto age : ages) {
                const auto id = Uuid::generate();
                ids.push_back(id);
                auto marked = local->with_db([&](Database& db) {
                    return TombstoneStore(db).mark_deleted(EntityKind::Recipe, id, std::nullopt,
                                                           Timestamp(now.millis() - age));
                });
                RC_ASSERT(marked.is_ok());
                if (std::chrono::milliseconds(age) > kRetention) {
                    ++expired;
                }
            }

            auto removed = local->with_db([&](Database& db) {
                return TombstoneStore(db).cleanup(kRetention, now);
            });
            RC_ASSERT(removed.is_ok());
            RC_ASSERT(removed.unwrap() == expired);

            for (size_t i = 0; i < ids.size(); ++i) {
                auto present = local->with_db([&](Database& db) {
                    return TombstoneStore(db).is_deleted(ids[i]);
                });
                RC_ASSERT(present.unwrap() == (std::chrono::milliseconds(ages[i]) <= kRetention));
            }
        }));
}

TEST_CASE("Property: marking twice keeps the first deletion time", "[property][tombstones]") {
    REQUIRE(rc::check("mark_deleted is idempotent",
        [] {
            const auto first = *rc::gen::inRange<int64_t>(1, 2'000'000'000'000);
            const auto second = *rc::gen::inRange<int64_t>(1, 2'000'000'000'000);
            const auto id = Uuid::generate();

            auto local = sync::LocalStore::open_memory().unwrap();
            auto result = local->with_db([&](Database& db) -> Res<std::optional<Tombstone>> {
                TombstoneStore tombstones(db);
                auto created = tombstones.mark_deleted(EntityKind::Collection, id, std::nullopt, Timestamp(first));
                if (created.is_err()) return Res<std::optional<Tombstone>>::err(created.unwrap_err());
                auto again = tombstones.mark_deleted(EntityKind::Collection, id, std::nullopt, Timestamp(second));
                if (again.is_err()) return Res<std::optional<Tombstone>>::err(again.unwrap_err());
                RC_ASSERT(created.unwrap());
                RC_ASSERT_FALSE(again.unwrap());
                return tombstones.get(id);
            });

            RC_ASSERT(result.is_ok());
            RC_ASSERT(result.unwrap().has_value());
            RC_ASSERT(result.unwrap()->deleted_at == Timestamp(first));
        }));
}
