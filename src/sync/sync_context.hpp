#pragma once

#include "sync/event_bus.hpp"
#include "sync/local_store.hpp"
#include "sync/remote_store.hpp"
#include "sync/sync_config.hpp"
#include <QThreadPool>

namespace ladle::sync {

/**
 * SyncContext - The collaborators every repository is built from.
 * All referenced objects must outlive the repositories.
 */
struct SyncContext {
    LocalStore& local;
    RemoteStore& remote;
    EventBus& events;
    QThreadPool& pool;
    SyncConfig config;
};

} // namespace ladle::sync
