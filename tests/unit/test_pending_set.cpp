#include <catch2/catch_test_macros.hpp>
#include "sync/pending_set.hpp"

using namespace ladle;
using namespace ladle::sync;

TEST_CASE("PendingSet tracks ids awaiting sync", "[sync][pending]") {
    PendingSet pending;
    const auto a = Uuid::generate();
    const auto b = Uuid::generate();

    REQUIRE(pending.empty());
    pending.mark(a);
    pending.mark(b);
    pending.mark(a);
    REQUIRE(pending.size() == 2);
    REQUIRE(pending.contains(a));

    auto ids = pending.snapshot();
    REQUIRE(ids.size() == 2);
    REQUIRE(ids[0] < ids[1]);

    pending.clear(a);
    REQUIRE_FALSE(pending.contains(a));
    pending.clear_all();
    REQUIRE(pending.empty());
}

TEST_CASE("PendingSet drops an id after max attempts", "[sync][pending][retry]") {
    PendingSet pending(10);
    const auto id = Uuid::generate();
    pending.mark(id);

    for (int attempt = 1; attempt < 10; ++attempt) {
        REQUIRE(pending.record_failure(id));
        REQUIRE(pending.failures(id) == attempt);
    }
    REQUIRE_FALSE(pending.record_failure(id));
    REQUIRE_FALSE(pending.contains(id));
    REQUIRE(pending.failures(id) == 0);

    SECTION("Failures on ids that are not pending are ignored") {
        REQUIRE_FALSE(pending.record_failure(Uuid::generate()));
        REQUIRE(pending.empty());
    }

    SECTION("A fresh write resets the counter") {
        pending.mark(id);
        REQUIRE(pending.record_failure(id));
        pending.mark(id);
        REQUIRE(pending.failures(id) == 0);
    }
}

TEST_CASE("PendingSet keeps ids marked again after a push began", "[sync][pending]") {
    PendingSet pending;
    const auto id = Uuid::generate();
    REQUIRE(pending.generation(id) == 0);

    pending.mark(id);
    const auto before = pending.generation(id);
    REQUIRE(before != 0);

    SECTION("An unchanged id is cleared") {
        REQUIRE(pending.clear_if_unchanged(id, before));
        REQUIRE_FALSE(pending.contains(id));
    }

    SECTION("A newer mark survives") {
        pending.mark(id);
        REQUIRE(pending.generation(id) != before);
        REQUIRE_FALSE(pending.clear_if_unchanged(id, before));
        REQUIRE(pending.contains(id));
        REQUIRE(pending.clear_if_unchanged(id, pending.generation(id)));
        REQUIRE(pending.empty());
    }

    SECTION("Failures keep the generation") {
        REQUIRE(pending.record_failure(id));
        REQUIRE(pending.generation(id) == before);
    }

    SECTION("Ids marked only after the push began are kept") {
        pending.clear(id);
        const auto absent = pending.generation(id);
        pending.mark(id);
        REQUIRE_FALSE(pending.clear_if_unchanged(id, absent));
        REQUIRE(pending.contains(id));
    }
}
