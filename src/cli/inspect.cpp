#include "cli/inspect.hpp"

#include "storage/collection_store.hpp"
#include "storage/connection_store.hpp"
#include "storage/recipe_store.hpp"
#include "storage/tombstone_store.hpp"
#include "storage/user_store.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace ladle::cli {

namespace {

[[nodiscard]] QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString to_json_text(const QJsonObject& root) {
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

[[nodiscard]] QString lines_or_placeholder(const QStringList& lines, const QString& placeholder) {
    if (lines.isEmpty()) {
        return placeholder + QLatin1Char('\n');
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

template<typename T>
[[nodiscard]] Res<int> count_of(Res<std::vector<T>> listed) {
    return std::move(listed).map([](const std::vector<T>& rows) { return static_cast<int>(rows.size()); });
}

} // namespace

QString format_queue(const std::vector<SyncOperation>& ops, bool json) {
    if (json) {
        QJsonArray items;
        for (const auto& op : ops) {
            QJsonObject obj;
            obj.insert(QStringLiteral("id"), static_cast<qint64>(op.id));
            obj.insert(QStringLiteral("entityKind"), qs(to_string(op.entity_kind)));
            obj.insert(QStringLiteral("entityId"), qs(op.entity_id.to_string()));
            obj.insert(QStringLiteral("op"), qs(to_string(op.op_kind)));
            obj.insert(QStringLiteral("status"), qs(to_string(op.status)));
            obj.insert(QStringLiteral("attempts"), op.attempts);
            if (op.last_error) {
                obj.insert(QStringLiteral("lastError"), qs(*op.last_error));
            }
            obj.insert(QStringLiteral("updatedAt"), qs(op.updated_at.to_iso_string()));
            items.append(obj);
        }
        return to_json_text(QJsonObject{{QStringLiteral("operations"), items}});
    }

    QStringList lines;
    for (const auto& op : ops) {
        auto line = QStringLiteral("%1 %2 %3 %4 %5 attempts=%6")
                        .arg(op.id)
                        .arg(qs(to_string(op.entity_kind)),
                             qs(op.entity_id.to_string()),
                             qs(to_string(op.op_kind)),
                             qs(to_string(op.status)))
                        .arg(op.attempts);
        if (op.last_error) {
            line += QStringLiteral(" error=") + qs(*op.last_error);
        }
        lines.append(line);
    }
    return lines_or_placeholder(lines, QStringLiteral("(no operations)"));
}

QString format_tombstones(const std::vector<Tombstone>& tombstones, bool json) {
    if (json) {
        QJsonArray items;
        for (const auto& t : tombstones) {
            QJsonObject obj;
            obj.insert(QStringLiteral("entityKind"), qs(to_string(t.entity_kind)));
            obj.insert(QStringLiteral("entityId"), qs(t.entity_id.to_string()));
            obj.insert(QStringLiteral("deletedAt"), qs(t.deleted_at.to_iso_string()));
            if (t.remote_record_id) {
                obj.insert(QStringLiteral("remoteRecordId"), qs(*t.remote_record_id));
            }
            items.append(obj);
        }
        return to_json_text(QJsonObject{{QStringLiteral("tombstones"), items}});
    }

    QStringList lines;
    for (const auto& t : tombstones) {
        lines.append(QStringLiteral("%1 %2 deleted %3")
                         .arg(qs(to_string(t.entity_kind)),
                              qs(t.entity_id.to_string()),
                              qs(t.deleted_at.to_iso_string())));
    }
    return lines_or_placeholder(lines, QStringLiteral("(no tombstones)"));
}

QString format_stats(const StoreStats& stats, bool json) {
    if (json) {
        QJsonObject queue;
        queue.insert(QStringLiteral("queued"), stats.queue.queued);
        queue.insert(QStringLiteral("inProgress"), stats.queue.in_progress);
        queue.insert(QStringLiteral("completed"), stats.queue.completed);
        queue.insert(QStringLiteral("failed"), stats.queue.failed);

        QJsonObject entities;
        entities.insert(QStringLiteral("recipes"), stats.recipes);
        entities.insert(QStringLiteral("collections"), stats.collections);
        entities.insert(QStringLiteral("connections"), stats.connections);
        entities.insert(QStringLiteral("users"), stats.users);

        QJsonObject root;
        root.insert(QStringLiteral("queue"), queue);
        root.insert(QStringLiteral("entities"), entities);
        root.insert(QStringLiteral("tombstones"), stats.tombstones);
        return to_json_text(root);
    }

    return QStringLiteral(
               "recipes: %1\n"
               "collections: %2\n"
               "connections: %3\n"
               "users: %4\n"
               "tombstones: %5\n"
               "queue: %6 queued, %7 in progress, %8 failed, %9 completed\n")
        .arg(stats.recipes)
        .arg(stats.collections)
        .arg(stats.connections)
        .arg(stats.users)
        .arg(stats.tombstones)
        .arg(stats.queue.queued)
        .arg(stats.queue.in_progress)
        .arg(stats.queue.failed)
        .arg(stats.queue.completed);
}

Res<StoreStats> collect_stats(sync::LocalStore& store) {
    return store.with_db([](storage::Database& db) -> Res<StoreStats> {
        StoreStats stats;

        auto queue = storage::SyncOperationQueue(db).stats();
        if (queue.is_err()) return Res<StoreStats>::err(queue.unwrap_err());
        stats.queue = queue.unwrap();

        auto tombstones = count_of(storage::TombstoneStore(db).list());
        if (tombstones.is_err()) return Res<StoreStats>::err(tombstones.unwrap_err());
        stats.tombstones = tombstones.unwrap();

        auto recipes = storage::RecipeStore(db).count();
        if (recipes.is_err()) return Res<StoreStats>::err(recipes.unwrap_err());
        stats.recipes = recipes.unwrap();

        auto collections = count_of(storage::CollectionStore(db).list_all());
        if (collections.is_err()) return Res<StoreStats>::err(collections.unwrap_err());
        stats.collections = collections.unwrap();

        auto connections = count_of(storage::ConnectionStore(db).list_all());
        if (connections.is_err()) return Res<StoreStats>::err(connections.unwrap_err());
        stats.connections = connections.unwrap();

        auto users = count_of(storage::UserStore(db).list_all());
        if (users.is_err()) return Res<StoreStats>::err(users.unwrap_err());
        stats.users = users.unwrap();

        return Res<StoreStats>::ok(stats);
    });
}

Res<QString> run_command(sync::LocalStore& store,
                         const QString& command,
                         const InspectOptions& options,
                         const sync::SyncConfig& config) {
    if (command == QStringLiteral("queue")) {
        return store.with_db([&](storage::Database& db) {
            return storage::SyncOperationQueue(db).list(options.status);
        }).map([&](const std::vector<SyncOperation>& ops) {
            return format_queue(ops, options.json);
        });
    }

    if (command == QStringLiteral("tombstones")) {
        return store.with_db([](storage::Database& db) {
            return storage::TombstoneStore(db).list();
        }).map([&](const std::vector<Tombstone>& tombstones) {
            return format_tombstones(tombstones, options.json);
        });
    }

    if (command == QStringLiteral("cleanup-tombstones")) {
        const auto retention = std::chrono::duration_cast<std::chrono::milliseconds>(config.tombstone_retention);
        return store.with_db([&](storage::Database& db) {
            return storage::TombstoneStore(db).cleanup(retention);
        }).map([](int removed) {
            return QStringLiteral("Removed %1 tombstones\n").arg(removed);
        });
    }

    if (command == QStringLiteral("purge-completed")) {
        return store.with_db([](storage::Database& db) {
            return storage::SyncOperationQueue(db).purge_completed(Timestamp::now());
        }).map([](int purged) {
            return QStringLiteral("Purged %1 completed operations\n").arg(purged);
        });
    }

    if (command == QStringLiteral("stats")) {
        return collect_stats(store).map([&](const StoreStats& stats) {
            return format_stats(stats, options.json);
        });
    }

    return Res<QString>::err(Error{ErrorKind::InvalidData, "Unknown command: " + command.toStdString()});
}

} // namespace ladle::cli
