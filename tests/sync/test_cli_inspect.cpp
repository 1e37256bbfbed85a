#include <catch2/catch_test_macros.hpp>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include <chrono>

#include "cli/inspect.hpp"
#include "core/recipe.hpp"
#include "storage/recipe_store.hpp"
#include "storage/sync_operation_queue.hpp"
#include "storage/tombstone_store.hpp"
#include "sync/local_store.hpp"

using namespace ladle;

namespace {

Uuid fixedId(const char* text) {
    return *Uuid::parse(text);
}

} // namespace

TEST_CASE("CLI: queue lists operations", "[cli][queue]") {
    const auto entity = fixedId("11111111-1111-1111-1111-111111111111");
    SyncOperation queued{
        .id = 1,
        .entity_kind = EntityKind::Recipe,
        .entity_id = entity,
        .op_kind = OpKind::Create,
        .status = OpStatus::Queued,
        .created_at = Timestamp(1000),
        .updated_at = Timestamp(1000)
    };
    SyncOperation failed = queued;
    failed.id = 2;
    failed.op_kind = OpKind::Update;
    failed.status = OpStatus::Failed;
    failed.attempts = 3;
    failed.last_error = "offline";

    SECTION("text") {
        const auto expected = QStringLiteral(
            "1 recipe 11111111-1111-1111-1111-111111111111 create queued attempts=0\n"
            "2 recipe 11111111-1111-1111-1111-111111111111 update failed attempts=3 error=offline\n");
        REQUIRE(cli::format_queue({queued, failed}, false) == expected);
        REQUIRE(cli::format_queue({}, false) == QStringLiteral("(no operations)\n"));
    }

    SECTION("json") {
        const auto parsed = QJsonDocument::fromJson(cli::format_queue({queued, failed}, true).toUtf8());
        REQUIRE(parsed.isObject());
        const auto ops = parsed.object().value(QStringLiteral("operations")).toArray();
        REQUIRE(ops.size() == 2);

        const auto first = ops.at(0).toObject();
        REQUIRE(first.value(QStringLiteral("entityKind")).toString() == QStringLiteral("recipe"));
        REQUIRE(first.value(QStringLiteral("entityId")).toString() == QString::fromStdString(entity.to_string()));
        REQUIRE(first.value(QStringLiteral("status")).toString() == QStringLiteral("queued"));
        REQUIRE_FALSE(first.contains(QStringLiteral("lastError")));

        const auto second = ops.at(1).toObject();
        REQUIRE(second.value(QStringLiteral("op")).toString() == QStringLiteral("update"));
        REQUIRE(second.value(QStringLiteral("attempts")).toInt() == 3);
        REQUIRE(second.value(QStringLiteral("lastError")).toString() == QStringLiteral("offline"));
    }
}

TEST_CASE("CLI: tombstones", "[cli][tombstones]") {
    const Tombstone tombstone{
        .entity_id = fixedId("22222222-2222-2222-2222-222222222222"),
        .entity_kind = EntityKind::Collection,
        .deleted_at = Timestamp(86'400'000),
        .remote_record_id = std::string("22222222-2222-2222-2222-222222222222")
    };

    const auto text = cli::format_tombstones({tombstone}, false);
    REQUIRE(text == QStringLiteral("collection 22222222-2222-2222-2222-222222222222 deleted ") +
                        QString::fromStdString(tombstone.deleted_at.to_iso_string()) + QStringLiteral("\n"));
    REQUIRE(cli::format_tombstones({}, false) == QStringLiteral("(no tombstones)\n"));

    const auto parsed = QJsonDocument::fromJson(cli::format_tombstones({tombstone}, true).toUtf8());
    const auto items = parsed.object().value(QStringLiteral("tombstones")).toArray();
    REQUIRE(items.size() == 1);
    REQUIRE(items.at(0).toObject().value(QStringLiteral("remoteRecordId")).toString() ==
            QStringLiteral("22222222-2222-2222-2222-222222222222"));
}

TEST_CASE("CLI: stats", "[cli][stats]") {
    cli::StoreStats stats;
    stats.recipes = 4;
    stats.collections = 2;
    stats.users = 1;
    stats.tombstones = 3;
    stats.queue.queued = 5;
    stats.queue.failed = 1;
    stats.queue.completed = 7;

    const auto expected = QStringLiteral(
        "recipes: 4\n"
        "collections: 2\n"
        "connections: 0\n"
        "users: 1\n"
        "tombstones: 3\n"
        "queue: 5 queued, 0 in progress, 1 failed, 7 completed\n");
    REQUIRE(cli::format_stats(stats, false) == expected);

    const auto root = QJsonDocument::fromJson(cli::format_stats(stats, true).toUtf8()).object();
    REQUIRE(root.value(QStringLiteral("tombstones")).toInt() == 3);
    REQUIRE(root.value(QStringLiteral("queue")).toObject().value(QStringLiteral("completed")).toInt() == 7);
    REQUIRE(root.value(QStringLiteral("entities")).toObject().value(QStringLiteral("recipes")).toInt() == 4);
}

TEST_CASE("CLI: commands run against a store", "[cli]") {
    auto store = sync::LocalStore::open_memory().unwrap();
    const auto owner = Uuid::generate();
    const auto kept = create_recipe(Uuid::generate(), owner, "Kept");
    const auto gone = Uuid::generate();
    const auto ancient = Uuid::generate();

    auto seeded = store->with_db([&](storage::Database& db) -> Res<void> {
        auto saved = storage::RecipeStore(db).save(kept);
        if (saved.is_err()) return saved;

        storage::SyncOperationQueue queue(db);
        auto created = queue.enqueue(EntityKind::Recipe, kept.id, OpKind::Create, Timestamp(1000));
        if (created.is_err()) return Res<void>::err(created.unwrap_err());
        auto done = queue.mark_completed(created.unwrap(), Timestamp(2000));
        if (done.is_err()) return done;
        auto deleted = queue.enqueue(EntityKind::Recipe, gone, OpKind::Delete);
        if (deleted.is_err()) return Res<void>::err(deleted.unwrap_err());

        storage::TombstoneStore tombstones(db);
        auto recent = tombstones.mark_deleted(EntityKind::Recipe, gone, std::nullopt);
        if (recent.is_err()) return Res<void>::err(recent.unwrap_err());
        auto old = tombstones.mark_deleted(EntityKind::Recipe, ancient, std::nullopt,
                                           Timestamp::now() - std::chrono::days(45));
        if (old.is_err()) return Res<void>::err(old.unwrap_err());
        return Res<void>::ok();
    });
    REQUIRE(seeded.is_ok());

    SECTION("stats") {
        auto output = cli::run_command(*store, QStringLiteral("stats"), {});
        REQUIRE(output.is_ok());
        REQUIRE(output.unwrap().startsWith(QStringLiteral("recipes: 1\n")));
        REQUIRE(output.unwrap().contains(QStringLiteral("tombstones: 2\n")));
        REQUIRE(output.unwrap().contains(QStringLiteral("queue: 1 queued, 0 in progress, 0 failed, 1 completed\n")));
    }

    SECTION("queue filtered by status") {
        cli::InspectOptions options;
        options.status = OpStatus::Queued;
        auto output = cli::run_command(*store, QStringLiteral("queue"), options).unwrap();
        REQUIRE(output.count(QLatin1Char('\n')) == 1);
        REQUIRE(output.contains(QString::fromStdString(gone.to_string())));
        REQUIRE(output.contains(QStringLiteral(" delete queued ")));
    }

    SECTION("cleanup-tombstones drops only expired tombstones") {
        auto output = cli::run_command(*store, QStringLiteral("cleanup-tombstones"), {}).unwrap();
        REQUIRE(output == QStringLiteral("Removed 1 tombstones\n"));
        auto listed = cli::run_command(*store, QStringLiteral("tombstones"), {}).unwrap();
        REQUIRE(listed.contains(QString::fromStdString(gone.to_string())));
        REQUIRE_FALSE(listed.contains(QString::fromStdString(ancient.to_string())));
    }

    SECTION("purge-completed") {
        auto output = cli::run_command(*store, QStringLiteral("purge-completed"), {}).unwrap();
        REQUIRE(output == QStringLiteral("Purged 1 completed operations\n"));
        auto stats = cli::collect_stats(*store).unwrap();
        REQUIRE(stats.queue.completed == 0);
        REQUIRE(stats.queue.queued == 1);
    }

    SECTION("unknown commands are rejected") {
        auto output = cli::run_command(*store, QStringLiteral("frobnicate"), {});
        REQUIRE(output.is_err());
        REQUIRE(output.unwrap_err().kind == ErrorKind::InvalidData);
    }
}
