#pragma once

#include "core/result.hpp"
#include "core/sync_types.hpp"
#include "storage/sync_operation_queue.hpp"
#include "sync/local_store.hpp"
#include "sync/sync_config.hpp"
#include <QString>
#include <optional>
#include <vector>

namespace ladle::cli {

struct InspectOptions {
    bool json = false;
    std::optional<OpStatus> status;  // 'queue' filter
};

struct StoreStats {
    storage::QueueStats queue;
    int tombstones = 0;
    int recipes = 0;
    int collections = 0;
    int connections = 0;
    int users = 0;
};

// Formatters are pure so they can be tested without a database.

// One line per operation: "<id> <kind> <entity> <op> <status> attempts=<n>[ error=<msg>]".
[[nodiscard]] QString format_queue(const std::vector<SyncOperation>& ops, bool json);

[[nodiscard]] QString format_tombstones(const std::vector<Tombstone>& tombstones, bool json);

[[nodiscard]] QString format_stats(const StoreStats& stats, bool json);

[[nodiscard]] Res<StoreStats> collect_stats(sync::LocalStore& store);

/**
 * Run one inspection command ("queue", "tombstones", "cleanup-tombstones",
 * "purge-completed", "stats") and return its output. Unknown commands are
 * InvalidData.
 */
[[nodiscard]] Res<QString> run_command(sync::LocalStore& store,
                                       const QString& command,
                                       const InspectOptions& options,
                                       const sync::SyncConfig& config = {});

} // namespace ladle::cli
