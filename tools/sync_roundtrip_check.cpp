#include <QCoreApplication>
#include <QThreadPool>

#include "core/recipe.hpp"
#include "sync/event_bus.hpp"
#include "sync/in_memory_remote_store.hpp"
#include "sync/local_store.hpp"
#include "sync/log.hpp"
#include "sync/recipe_repository.hpp"
#include "sync/record_codec.hpp"

namespace {

struct Device {
    std::unique_ptr<ladle::sync::LocalStore> local;
    ladle::sync::EventBus events;
    std::unique_ptr<ladle::sync::RecipeRepository> recipes;
};

bool open_device(Device& device, ladle::sync::RemoteStore& remote, QThreadPool& pool) {
    auto opened = ladle::sync::LocalStore::open_memory();
    if (opened.is_err()) {
        qCritical().noquote() << "open failed:" << QString::fromStdString(opened.unwrap_err().message);
        return false;
    }
    device.local = std::move(opened).unwrap();
    device.recipes = std::make_unique<ladle::sync::RecipeRepository>(
        ladle::sync::SyncContext{*device.local, remote, device.events, pool, {}});
    return true;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("LADLE_DEBUG_SYNC", "1");
    ladle::sync::enable_sync_debug_output();
    ladle::sync::register_sync_meta_types();

    QThreadPool pool;
    ladle::sync::InMemoryRemoteStore remote;
    Device a;
    Device b;
    if (!open_device(a, remote, pool) || !open_device(b, remote, pool)) {
        return 1;
    }

    const auto owner = ladle::Uuid::generate();
    const auto recipeType = ladle::remote_record_type(ladle::EntityKind::Recipe);

    // A shares a recipe publicly.
    auto recipe = ladle::with_visibility(
        ladle::create_recipe(ladle::Uuid::generate(), owner, "Shakshuka"), ladle::Visibility::Public);
    recipe.ingredients = {"eggs", "tomatoes", "peppers"};
    if (a.recipes->create(recipe).is_err()) {
        return 2;
    }
    a.recipes->wait_for_background();

    const auto recordId = recipe.id.to_string();
    if (!remote.record(ladle::sync::Partition::Private, recipeType, recordId)
        || !remote.record(ladle::sync::Partition::Public, recipeType, recordId)) {
        qCritical() << "recipe was not replicated to both partitions";
        return 3;
    }

    // B pulls it.
    auto pulled = b.recipes->sync_from_remote(owner);
    if (pulled.is_err() || pulled.unwrap().inserted != 1) {
        qCritical() << "B did not pull the recipe";
        return 4;
    }
    auto onB = b.recipes->fetch(recipe.id);
    if (onB.is_err() || !onB.unwrap() || onB.unwrap()->title != recipe.title
        || onB.unwrap()->ingredients != recipe.ingredients) {
        qCritical() << "B holds a different recipe";
        return 5;
    }

    // A makes it private again: the public copy disappears.
    if (a.recipes->update(ladle::with_visibility(recipe, ladle::Visibility::Private)).is_err()) {
        return 6;
    }
    a.recipes->wait_for_background();
    if (remote.record(ladle::sync::Partition::Public, recipeType, recordId)) {
        qCritical() << "public copy survived the switch to private";
        return 7;
    }

    // A deletes it; a stale copy reappearing remotely must not resurrect it.
    auto stale = remote.record(ladle::sync::Partition::Private, recipeType, recordId);
    if (!stale || a.recipes->remove(recipe.id).is_err()) {
        return 8;
    }
    a.recipes->wait_for_background();
    if (remote.record(ladle::sync::Partition::Private, recipeType, recordId)) {
        qCritical() << "private record survived the delete";
        return 9;
    }

    remote.put_record(ladle::sync::Partition::Private, *stale);
    auto again = a.recipes->sync_from_remote(owner);
    auto resurrected = a.recipes->fetch(recipe.id);
    if (again.is_err() || again.unwrap().skipped_tombstoned != 1
        || resurrected.is_err() || resurrected.unwrap()) {
        qCritical() << "tombstone did not block the stale record";
        return 10;
    }

    qInfo() << "sync roundtrip ok";
    return 0;
}
