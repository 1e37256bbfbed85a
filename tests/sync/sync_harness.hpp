#pragma once

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QImage>
#include <QMutex>
#include <QMutexLocker>
#include <QTemporaryDir>
#include <QThreadPool>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/sync_operation_queue.hpp"
#include "storage/tombstone_store.hpp"
#include "sync/event_bus.hpp"
#include "sync/image_sync_manager.hpp"
#include "sync/in_memory_remote_store.hpp"
#include "sync/local_store.hpp"
#include "sync/sync_context.hpp"

namespace ladle::test {

inline bool spinUntil(const std::function<bool()>& predicate, int timeoutMs = 2000) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 25);
    }
    return true;
}

/** A noisy picture, so JPEG sizes depend on quality. */
inline QImage makeTestImage(int width, int height) {
    QImage image(width, height, QImage::Format_RGB32);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const int r = (x * 7 + y * 13) % 256;
            const int g = (x * x + y * 3) % 256;
            const int b = (x ^ y) % 256;
            image.setPixel(x, y, qRgb(r, g, b));
        }
    }
    return image;
}

/**
 * One device: an in-memory database, a bus and a worker pool, all talking to
 * a remote store that may be shared with other devices.
 */
class Device {
public:
    explicit Device(sync::RemoteStore& remote, sync::SyncConfig config = sync::SyncConfig{})
        : remote_(remote)
        , local_(sync::LocalStore::open_memory().unwrap())
        , config_(config)
    {
        pool_.setMaxThreadCount(2);
    }

    ~Device() {
        pool_.waitForDone();
    }

    sync::SyncContext context() {
        return sync::SyncContext{*local_, remote_, events_, pool_, config_};
    }

    /** Image manager for one entity kind, storing files under this device's directory. */
    std::unique_ptr<sync::ImageSyncManager> makeImages(sync::ImageConfig imageConfig,
                                                      const std::string& recordType) {
        return std::make_unique<sync::ImageSyncManager>(
            std::move(imageConfig), dir_.path(),
            sync::ImageCloudOps::for_remote_store(remote_, recordType), pool_, config_);
    }

    sync::LocalStore& local() { return *local_; }
    sync::EventBus& events() { return events_; }
    QThreadPool& pool() { return pool_; }
    QString path() const { return dir_.path(); }

    storage::QueueStats queueStats() {
        return local_->with_db([](storage::Database& db) {
            return storage::SyncOperationQueue(db).stats();
        }).unwrap();
    }

    std::vector<SyncOperation> operations(std::optional<OpStatus> status = std::nullopt) {
        return local_->with_db([&](storage::Database& db) {
            return storage::SyncOperationQueue(db).list(status);
        }).unwrap();
    }

    bool isTombstoned(const Uuid& id) {
        return local_->with_db([&](storage::Database& db) {
            return storage::TombstoneStore(db).is_deleted(id);
        }).unwrap();
    }

private:
    sync::RemoteStore& remote_;
    QTemporaryDir dir_;
    QThreadPool pool_;
    std::unique_ptr<sync::LocalStore> local_;
    sync::EventBus events_;
    sync::SyncConfig config_;
};

/**
 * Records bus events as "<signal>:<id>" strings. Connections are direct so
 * events emitted from workers are recorded without an event loop.
 */
class EventLog {
public:
    explicit EventLog(sync::EventBus& bus) {
        connections_.push_back(QObject::connect(&bus, &sync::EventBus::entityCreated, &bus,
                         [this](EntityKind, const Uuid& id) { add("created", id); }, Qt::DirectConnection));
        connections_.push_back(QObject::connect(&bus, &sync::EventBus::entityUpdated, &bus,
                         [this](EntityKind, const Uuid& id) { add("updated", id); }, Qt::DirectConnection));
        connections_.push_back(QObject::connect(&bus, &sync::EventBus::entityDeleted, &bus,
                         [this](EntityKind, const Uuid& id) { add("deleted", id); }, Qt::DirectConnection));
        connections_.push_back(QObject::connect(&bus, &sync::EventBus::visibilityChanged, &bus,
                         [this](EntityKind, const Uuid& id, Visibility, Visibility) { add("visibility", id); },
                         Qt::DirectConnection));
        connections_.push_back(QObject::connect(&bus, &sync::EventBus::assetUploadPending, &bus,
                         [this](EntityKind, const Uuid& id) { add("upload_pending", id); }, Qt::DirectConnection));
        connections_.push_back(QObject::connect(&bus, &sync::EventBus::assetUploadCompleted, &bus,
                         [this](EntityKind, const Uuid& id) { add("upload_completed", id); }, Qt::DirectConnection));
        connections_.push_back(QObject::connect(&bus, &sync::EventBus::syncError, &bus,
                         [this](EntityKind, const Uuid& id, const QString&) { add("error", id); },
                         Qt::DirectConnection));
    }

    ~EventLog() {
        for (const auto& connection : connections_) {
            QObject::disconnect(connection);
        }
    }

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    std::vector<std::string> entries() const {
        QMutexLocker lock(&mutex_);
        return entries_;
    }

    int count(const std::string& signal, const Uuid& id) const {
        const auto wanted = signal + ":" + id.to_string();
        QMutexLocker lock(&mutex_);
        int n = 0;
        for (const auto& entry : entries_) {
            if (entry == wanted) ++n;
        }
        return n;
    }

private:
    void add(const char* signal, const Uuid& id) {
        QMutexLocker lock(&mutex_);
        entries_.push_back(std::string(signal) + ":" + id.to_string());
    }

    std::vector<QMetaObject::Connection> connections_;
    mutable QMutex mutex_;
    std::vector<std::string> entries_;
};

} // namespace ladle::test
