#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sync/pending_set.hpp"
#include "sync/remote_store.hpp"
#include "sync/sync_config.hpp"
#include <QByteArray>
#include <QFuture>
#include <QImage>
#include <QMutex>
#include <QString>
#include <QThreadPool>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace ladle::sync {

/**
 * ImageSyncState - Where an entity's image currently lives.
 */
enum class ImageSyncState {
    Synced,
    UploadPending,
    DownloadPending,
    LocalOnly
};

[[nodiscard]] const char* to_string(ImageSyncState state) noexcept;

/**
 * DownloadOutcome - Result of one coalesced download task.
 */
struct DownloadOutcome {
    enum class Status {
        Downloaded,
        NotFound,
        Failed
    };
    
    Status status{Status::Failed};
    std::optional<Error> error;
    
    /** ok(true) downloaded, ok(false) not found, err otherwise. */
    [[nodiscard]] Res<bool> to_result() const;
};

/**
 * ImageCloudOps - The remote operations an ImageSyncManager is given.
 */
struct ImageCloudOps {
    using UploadFn = std::function<Res<std::string>(const Uuid&, const QByteArray&, Partition)>;
    using DownloadFn = std::function<Res<std::optional<QByteArray>>(const Uuid&, Partition)>;
    using DeleteFn = std::function<Res<void>(const Uuid&, Partition)>;
    
    UploadFn upload;
    DownloadFn download;
    DeleteFn remove;
    
    /** Operations addressing assets "<record_type>Image-<id>" in store. */
    [[nodiscard]] static ImageCloudOps for_remote_store(RemoteStore& store, std::string record_type);
};

/**
 * ImageSyncManager - Local image cache and cloud replication for one entity kind.
 *
 * Files live at <root>/<config.directory>/<entity id>.jpg. Downloads are
 * coalesced per (id, partition): concurrent callers share one task and one
 * call to the download operation. A "not found" answer is remembered for
 * the configured TTL and forgotten as soon as an upload for the id succeeds.
 *
 * All in-memory state is guarded by one mutex; no remote call is made while
 * holding it.
 */
class ImageSyncManager {
public:
    struct Stats {
        int downloads_started{0};
        int downloads_coalesced{0};
        int negative_cache_hits{0};
        int uploads{0};
    };
    
    ImageSyncManager(ImageConfig config,
                     const QString& root_directory,
                     ImageCloudOps ops,
                     QThreadPool& pool,
                     const SyncConfig& sync_config = SyncConfig{});
    ~ImageSyncManager();
    
    ImageSyncManager(const ImageSyncManager&) = delete;
    ImageSyncManager& operator=(const ImageSyncManager&) = delete;
    
    [[nodiscard]] const ImageConfig& config() const { return config_; }
    [[nodiscard]] const QString& directory() const { return directory_; }
    
    [[nodiscard]] static QString filename_for(const Uuid& id);
    [[nodiscard]] QString path_for(const Uuid& id) const;
    
    // Processing
    
    [[nodiscard]] static Res<QByteArray> encode_jpeg(const QImage& image, int quality);
    
    /**
     * Scale to config.max_dimension, then encode at qualities 80, 60, 40
     * until the result fits config.target_bytes. If none does, the smallest
     * encoding is accepted when within config.ceiling_bytes; otherwise
     * AssetTooLarge.
     */
    [[nodiscard]] static Res<QByteArray> optimize(const QImage& image, const ImageConfig& config);
    
    // Local files
    
    /** Optimize and write the image. Returns the stored file name. */
    [[nodiscard]] Res<QString> save_image(const Uuid& id, const QImage& image);
    
    /** Decode encoded bytes (any format Qt reads) and save them. */
    [[nodiscard]] Res<QString> save_image_data(const Uuid& id, const QByteArray& encoded);
    
    [[nodiscard]] Res<QImage> load_image(const Uuid& id) const;
    [[nodiscard]] Res<QByteArray> load_image_data(const Uuid& id) const;
    
    /** Returns whether a file was removed. */
    [[nodiscard]] Res<bool> delete_image(const Uuid& id);
    
    [[nodiscard]] bool image_exists(const Uuid& id) const;
    [[nodiscard]] std::optional<Timestamp> modification_time(const Uuid& id) const;
    
    /** Copy source's file to target's name. Returns the new file name. */
    [[nodiscard]] Res<QString> copy_image(const Uuid& source, const Uuid& target);
    
    // Cloud
    
    /** Upload the local file. Returns the remote asset id. */
    [[nodiscard]] Res<std::string> upload_to_cloud(const Uuid& id, Partition partition = Partition::Private);
    
    /**
     * Start (or join) the download of id's asset. The in-flight entry is
     * registered before the task can run.
     */
    [[nodiscard]] QFuture<DownloadOutcome> download_from_cloud_async(
        const Uuid& id, Partition partition = Partition::Private);
    
    /** Blocking form of download_from_cloud_async. ok(false) when not found. */
    [[nodiscard]] Res<bool> download_from_cloud(const Uuid& id, Partition partition = Partition::Private);
    
    /** Delete the remote asset. A missing asset counts as deleted. */
    [[nodiscard]] Res<void> delete_from_cloud(const Uuid& id, Partition partition);
    
    // Bookkeeping
    
    [[nodiscard]] PendingSet& pending_uploads() { return pending_uploads_; }
    [[nodiscard]] const PendingSet& pending_uploads() const { return pending_uploads_; }
    
    /**
     * Count a failed upload for id. Quota errors and other non-retryable
     * failures drop the id at once. Returns whether id is still pending.
     */
    bool note_upload_failure(const Uuid& id, const Error& error);
    
    /** nullopt when there is no image locally or remotely. */
    [[nodiscard]] std::optional<ImageSyncState> sync_state(
        const Uuid& id, std::optional<Timestamp> remote_asset_modified_at) const;
    
    [[nodiscard]] bool is_cached_not_found(const Uuid& id, Partition partition) const;
    void clear_not_found_cache(const Uuid& id);
    void clear_all_not_found_cache();
    
    /** Entries still held by the not-found cache; expired ones are dropped as downloads run. */
    [[nodiscard]] size_t not_found_cache_size() const;
    
    [[nodiscard]] Stats stats() const;
    
    /** Block until every in-flight download has finished. */
    void wait_for_downloads();

private:
    using Key = std::pair<Uuid, Partition>;
    
    struct InFlight {
        QFuture<DownloadOutcome> future;
        uint64_t generation{0};
    };
    
    DownloadOutcome run_download(const Uuid& id, Partition partition, uint64_t generation);
    [[nodiscard]] Res<void> write_file(const Uuid& id, const QByteArray& bytes);
    [[nodiscard]] bool cached_not_found_locked(const Key& key) const;
    void prune_not_found_locked(Timestamp now);
    
    ImageConfig config_;
    QString directory_;
    ImageCloudOps ops_;
    QThreadPool& pool_;
    std::chrono::milliseconds not_found_ttl_;
    
    mutable QMutex mutex_;
    std::map<Key, InFlight> in_flight_;
    std::map<Key, Timestamp> not_found_until_;
    uint64_t next_generation_ = 0;
    Stats stats_;
    
    PendingSet pending_uploads_;
};

} // namespace ladle::sync
