#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <vector>

#include "sync/recipe_repository.hpp"
#include "sync/retry_scheduler.hpp"
#include "sync_harness.hpp"

using namespace ladle;
using namespace ladle::sync;
using namespace std::chrono_literals;
using Op = InMemoryRemoteStore::Operation;

namespace {

class FakeParticipant : public RetryParticipant {
public:
    std::atomic_int pending{1};
    std::atomic_int sweeps{0};
    std::atomic_bool succeed{true};
    std::function<void()> during;

    QString participant_name() const override { return QStringLiteral("fake"); }
    size_t pending_count() const override { return static_cast<size_t>(pending.load()); }

    SweepResult retry_pending(const std::atomic_bool& cancelled) override {
        ++sweeps;
        if (during) during();
        SweepResult result;
        if (cancelled) {
            result.cancelled = true;
            return result;
        }
        result.attempted = pending;
        if (succeed) {
            result.succeeded = pending;
            pending = 0;
        } else {
            result.failed = pending;
        }
        return result;
    }
};

RetryBackoff defaultBackoff() {
    const SyncConfig config;
    return RetryBackoff(config.retry_base, config.retry_max);
}

} // namespace

TEST_CASE("RetryScheduler: the delay doubles while sweeps fail and resets on success", "[sync][retry]") {
    InMemoryRemoteStore remote;
    test::Device device(remote);
    RecipeRepository recipes(device.context());
    RetryScheduler scheduler(remote, defaultBackoff());
    scheduler.add_participant(&recipes);

    std::vector<std::pair<bool, qint64>> finished;
    QObject::connect(&scheduler, &RetryScheduler::sweepFinished, &scheduler,
                     [&](bool ok, qint64 delay) { finished.emplace_back(ok, delay); }, Qt::DirectConnection);

    remote.set_available(false);
    auto recipe = create_recipe(Uuid::generate(), Uuid::generate(), "Paella");
    REQUIRE(recipes.create(recipe).is_ok());
    recipes.wait_for_background();
    REQUIRE(recipes.pending_count() == 1);
    REQUIRE(scheduler.next_delay() == 120s);

    auto first = scheduler.run_sweep();
    REQUIRE(first.attempted == 1);
    REQUIRE(first.failed == 1);
    REQUIRE(scheduler.next_delay() == 240s);

    REQUIRE_FALSE(scheduler.run_sweep().successful());
    REQUIRE(scheduler.next_delay() == 480s);
    REQUIRE(scheduler.backoff().consecutive_failures() == 2);

    remote.set_available(true);
    auto recovered = scheduler.run_sweep();
    REQUIRE(recovered.succeeded == 1);
    REQUIRE(scheduler.next_delay() == 120s);
    REQUIRE(scheduler.backoff().consecutive_failures() == 0);
    REQUIRE(recipes.pending_count() == 0);
    REQUIRE(remote.record(Partition::Private, "Recipe", recipe.id.to_string()).has_value());

    REQUIRE(finished == std::vector<std::pair<bool, qint64>>{{false, 240}, {false, 480}, {true, 120}});
}

TEST_CASE("RetryScheduler: the delay is capped at one hour", "[sync][retry]") {
    InMemoryRemoteStore remote;
    RetryScheduler scheduler(remote, defaultBackoff());
    FakeParticipant participant;
    participant.succeed = false;
    scheduler.add_participant(&participant);

    for (int i = 0; i < 10; ++i) {
        scheduler.run_sweep();
    }
    REQUIRE(scheduler.next_delay() == 3600s);
    REQUIRE(participant.sweeps.load() == 10);
}

TEST_CASE("RetryScheduler: nothing pending counts as success", "[sync][retry]") {
    InMemoryRemoteStore remote;
    RetryScheduler scheduler(remote, defaultBackoff());
    FakeParticipant participant;
    participant.succeed = false;
    scheduler.add_participant(&participant);

    scheduler.run_sweep();
    REQUIRE(scheduler.next_delay() == 240s);

    participant.pending = 0;
    auto idle = scheduler.run_sweep();
    REQUIRE(idle.attempted == 0);
    REQUIRE(idle.successful());
    REQUIRE(scheduler.next_delay() == 120s);
    REQUIRE(participant.sweeps.load() == 1);
}

TEST_CASE("RetryScheduler: an unreachable remote skips the participants", "[sync][retry]") {
    InMemoryRemoteStore remote;
    remote.set_available(false);
    RetryScheduler scheduler(remote, defaultBackoff());
    FakeParticipant participant;
    scheduler.add_participant(&participant);

    auto result = scheduler.run_sweep();
    REQUIRE(result.attempted == 1);
    REQUIRE(result.failed == 1);
    REQUIRE(participant.sweeps.load() == 0);
    REQUIRE(scheduler.next_delay() == 240s);
}

TEST_CASE("RetryScheduler: an entity is given up after ten failed attempts", "[sync][retry]") {
    InMemoryRemoteStore remote;
    test::Device device(remote);
    RecipeRepository recipes(device.context());
    RetryScheduler scheduler(remote, defaultBackoff());
    scheduler.add_participant(&recipes);

    remote.fail_always(Op::SaveRecord, Error{ErrorKind::NetworkUnavailable, "flaky"});
    auto recipe = create_recipe(Uuid::generate(), Uuid::generate(), "Brioche");
    REQUIRE(recipes.create(recipe).is_ok());
    recipes.wait_for_background();
    REQUIRE(recipes.pending_sync().failures(recipe.id) == 1);

    for (int attempt = 2; attempt < 10; ++attempt) {
        auto result = scheduler.run_sweep();
        REQUIRE(result.attempted == 1);
        REQUIRE(result.dropped == 0);
        REQUIRE(recipes.pending_sync().failures(recipe.id) == attempt);
    }

    auto last = scheduler.run_sweep();
    REQUIRE(last.attempted == 1);
    REQUIRE(last.dropped == 1);
    REQUIRE_FALSE(recipes.pending_sync().contains(recipe.id));
    REQUIRE(remote.call_count(Op::SaveRecord) == 10);

    auto after = scheduler.run_sweep();
    REQUIRE(after.attempted == 0);
    REQUIRE(remote.call_count(Op::SaveRecord) == 10);

    // The local copy is untouched and a new edit starts over.
    remote.clear_failures();
    REQUIRE(recipes.fetch(recipe.id).unwrap().has_value());
    REQUIRE(recipes.update(with_title(recipe, "Brioche loaf")).is_ok());
    recipes.wait_for_background();
    REQUIRE(recipes.pending_count() == 0);
    REQUIRE(remote.record(Partition::Private, "Recipe", recipe.id.to_string()).has_value());
}

TEST_CASE("RetryScheduler: stop cancels the rest of a sweep", "[sync][retry]") {
    InMemoryRemoteStore remote;
    RetryScheduler scheduler(remote, defaultBackoff());
    FakeParticipant first;
    FakeParticipant second;
    first.during = [&] { scheduler.stop(); };
    scheduler.add_participant(&first);
    scheduler.add_participant(&second);

    scheduler.start();
    REQUIRE(scheduler.is_running());

    auto result = scheduler.run_sweep();
    REQUIRE_FALSE(scheduler.is_running());
    REQUIRE(result.cancelled);
    REQUIRE(first.sweeps.load() == 1);
    REQUIRE(second.sweeps.load() == 0);
    REQUIRE(second.pending.load() == 1);
}

TEST_CASE("RetryScheduler: timed sweeps run on the thread pool", "[sync][retry]") {
    InMemoryRemoteStore remote;
    RetryScheduler scheduler(remote, RetryBackoff(1s, 4s));
    FakeParticipant participant;
    scheduler.add_participant(&participant);

    std::atomic_int finished{0};
    std::atomic_bool lastOk{false};
    QObject::connect(&scheduler, &RetryScheduler::sweepFinished, &scheduler, [&](bool ok, qint64) {
        lastOk = ok;
        ++finished;
    });

    scheduler.start();
    REQUIRE(test::spinUntil([&] { return finished.load() > 0; }, 5000));
    scheduler.stop();

    REQUIRE(lastOk.load());
    REQUIRE(participant.sweeps.load() == 1);
    REQUIRE(participant.pending.load() == 0);
    REQUIRE_FALSE(scheduler.is_running());
}
