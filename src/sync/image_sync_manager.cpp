#include "sync/image_sync_manager.hpp"
#include "sync/log.hpp"

#include <QBuffer>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <QImageWriter>
#include <QMutexLocker>
#include <QPromise>
#include <QSaveFile>
#include <QtConcurrent/QtConcurrent>
#include <array>
#include <vector>

namespace ladle::sync {

namespace {

constexpr std::array<int, 3> kQualityLadder{80, 60, 40};

QFuture<DownloadOutcome> ready_future(DownloadOutcome outcome) {
    QPromise<DownloadOutcome> promise;
    auto future = promise.future();
    promise.start();
    promise.addResult(std::move(outcome));
    promise.finish();
    return future;
}

QString describe(const Uuid& id, Partition partition) {
    return QStringLiteral("%1 (%2)").arg(to_qstring(id), QString::fromLatin1(to_string(partition)));
}

} // namespace

const char* to_string(ImageSyncState state) noexcept {
    switch (state) {
        case ImageSyncState::Synced: return "synced";
        case ImageSyncState::UploadPending: return "upload_pending";
        case ImageSyncState::DownloadPending: return "download_pending";
        case ImageSyncState::LocalOnly: return "local_only";
    }
    return "unknown";
}

Res<bool> DownloadOutcome::to_result() const {
    switch (status) {
        case Status::Downloaded: return Res<bool>::ok(true);
        case Status::NotFound: return Res<bool>::ok(false);
        case Status::Failed: break;
    }
    return Res<bool>::err(error.value_or(Error{ErrorKind::Internal, "Image download failed"}));
}

ImageCloudOps ImageCloudOps::for_remote_store(RemoteStore& store, std::string record_type) {
    return ImageCloudOps{
        .upload = [&store, record_type](const Uuid& id, const QByteArray& data, Partition partition) {
            return store.upload_asset(partition, asset_id_for(record_type, id), data);
        },
        .download = [&store, record_type](const Uuid& id, Partition partition) {
            return store.download_asset(partition, asset_id_for(record_type, id));
        },
        .remove = [&store, record_type](const Uuid& id, Partition partition) {
            return store.delete_asset(partition, asset_id_for(record_type, id));
        }
    };
}

ImageSyncManager::ImageSyncManager(ImageConfig config,
                                   const QString& root_directory,
                                   ImageCloudOps ops,
                                   QThreadPool& pool,
                                   const SyncConfig& sync_config)
    : config_(std::move(config))
    , directory_(QDir(root_directory).filePath(config_.directory))
    , ops_(std::move(ops))
    , pool_(pool)
    , not_found_ttl_(sync_config.not_found_ttl)
    , pending_uploads_(sync_config.max_attempts)
{
}

ImageSyncManager::~ImageSyncManager() {
    wait_for_downloads();
}

QString ImageSyncManager::filename_for(const Uuid& id) {
    return to_qstring(id) + QStringLiteral(".jpg");
}

QString ImageSyncManager::path_for(const Uuid& id) const {
    return QDir(directory_).filePath(filename_for(id));
}

// ============================================================================
// Processing
// ============================================================================

Res<QByteArray> ImageSyncManager::encode_jpeg(const QImage& image, int quality) {
    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly)) {
        return Res<QByteArray>::err(Error{ErrorKind::Internal, "Cannot open encode buffer"});
    }
    
    QImageWriter writer(&buffer, "jpeg");
    writer.setQuality(quality);
    if (!writer.write(image)) {
        return Res<QByteArray>::err(Error{ErrorKind::Internal,
                                          "JPEG encoding failed: " + writer.errorString().toStdString()});
    }
    buffer.close();
    return Res<QByteArray>::ok(std::move(bytes));
}

Res<QByteArray> ImageSyncManager::optimize(const QImage& image, const ImageConfig& config) {
    if (image.isNull()) {
        return Res<QByteArray>::err(Error{ErrorKind::InvalidData, "Image is empty"});
    }
    
    QImage scaled = image;
    if (image.width() > config.max_dimension || image.height() > config.max_dimension) {
        scaled = image.scaled(config.max_dimension, config.max_dimension,
                              Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }
    if (scaled.hasAlphaChannel()) {
        scaled = scaled.convertToFormat(QImage::Format_RGB32);
    }
    
    QByteArray smallest;
    for (int quality : kQualityLadder) {
        auto encoded = encode_jpeg(scaled, quality);
        if (encoded.is_err()) {
            return encoded;
        }
        smallest = std::move(encoded).unwrap();
        if (smallest.size() <= config.target_bytes) {
            return Res<QByteArray>::ok(std::move(smallest));
        }
    }
    
    if (smallest.size() <= config.ceiling_bytes) {
        qCDebug(ladleImagesLog) << "Image above target after compression, accepted at"
                                << smallest.size() << "bytes";
        return Res<QByteArray>::ok(std::move(smallest));
    }
    return Res<QByteArray>::err(Error{
        ErrorKind::AssetTooLarge,
        "Image is " + std::to_string(smallest.size()) + " bytes after compression, limit " +
            std::to_string(config.ceiling_bytes)});
}

// ============================================================================
// Local files
// ============================================================================

Res<void> ImageSyncManager::write_file(const Uuid& id, const QByteArray& bytes) {
    if (!QDir().mkpath(directory_)) {
        return Res<void>::err(Error{ErrorKind::Storage, "Cannot create " + directory_.toStdString()});
    }
    
    QSaveFile file(path_for(id));
    if (!file.open(QIODevice::WriteOnly)) {
        return Res<void>::err(Error{ErrorKind::Storage, "Cannot write image: " + file.errorString().toStdString()});
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        return Res<void>::err(Error{ErrorKind::Storage, "Cannot write image: " + file.errorString().toStdString()});
    }
    return Res<void>::ok();
}

Res<QString> ImageSyncManager::save_image(const Uuid& id, const QImage& image) {
    auto optimized = optimize(image, config_);
    if (optimized.is_err()) {
        return Res<QString>::err(optimized.unwrap_err());
    }
    
    auto written = write_file(id, optimized.unwrap());
    if (written.is_err()) {
        return Res<QString>::err(written.unwrap_err());
    }
    qCDebug(ladleImagesLog) << "Saved image" << to_qstring(id) << optimized.unwrap().size() << "bytes";
    return Res<QString>::ok(filename_for(id));
}

Res<QString> ImageSyncManager::save_image_data(const Uuid& id, const QByteArray& encoded) {
    QImage image;
    if (!image.loadFromData(encoded)) {
        return Res<QString>::err(Error{ErrorKind::InvalidData, "Unreadable image data"});
    }
    return save_image(id, image);
}

Res<QImage> ImageSyncManager::load_image(const Uuid& id) const {
    QImageReader reader(path_for(id));
    if (!QFileInfo::exists(reader.fileName())) {
        return Res<QImage>::err(Error{ErrorKind::NotFound, "No image for " + id.to_string()});
    }
    QImage image = reader.read();
    if (image.isNull()) {
        return Res<QImage>::err(Error{ErrorKind::InvalidData,
                                      "Cannot decode image: " + reader.errorString().toStdString()});
    }
    return Res<QImage>::ok(std::move(image));
}

Res<QByteArray> ImageSyncManager::load_image_data(const Uuid& id) const {
    QFile file(path_for(id));
    if (!file.exists()) {
        return Res<QByteArray>::err(Error{ErrorKind::NotFound, "No image for " + id.to_string()});
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Res<QByteArray>::err(Error{ErrorKind::Storage, "Cannot read image: " + file.errorString().toStdString()});
    }
    return Res<QByteArray>::ok(file.readAll());
}

Res<bool> ImageSyncManager::delete_image(const Uuid& id) {
    QFile file(path_for(id));
    if (!file.exists()) {
        return Res<bool>::ok(false);
    }
    if (!file.remove()) {
        return Res<bool>::err(Error{ErrorKind::Storage, "Cannot delete image: " + file.errorString().toStdString()});
    }
    return Res<bool>::ok(true);
}

bool ImageSyncManager::image_exists(const Uuid& id) const {
    return QFileInfo::exists(path_for(id));
}

std::optional<Timestamp> ImageSyncManager::modification_time(const Uuid& id) const {
    const QFileInfo info(path_for(id));
    if (!info.exists()) {
        return std::nullopt;
    }
    return Timestamp(info.lastModified().toMSecsSinceEpoch());
}

Res<QString> ImageSyncManager::copy_image(const Uuid& source, const Uuid& target) {
    auto data = load_image_data(source);
    if (data.is_err()) {
        return Res<QString>::err(data.unwrap_err());
    }
    auto written = write_file(target, data.unwrap());
    if (written.is_err()) {
        return Res<QString>::err(written.unwrap_err());
    }
    return Res<QString>::ok(filename_for(target));
}

// ============================================================================
// Cloud
// ============================================================================

Res<std::string> ImageSyncManager::upload_to_cloud(const Uuid& id, Partition partition) {
    auto data = load_image_data(id);
    if (data.is_err()) {
        return Res<std::string>::err(data.unwrap_err());
    }
    
    auto uploaded = ops_.upload(id, data.unwrap(), partition);
    if (uploaded.is_err()) {
        qCWarning(ladleImagesLog) << "Upload failed for" << describe(id, partition) << ":"
                                  << QString::fromStdString(uploaded.unwrap_err().message);
        return uploaded;
    }
    
    clear_not_found_cache(id);
    {
        QMutexLocker lock(&mutex_);
        ++stats_.uploads;
    }
    qCDebug(ladleImagesLog) << "Uploaded" << describe(id, partition);
    return uploaded;
}

bool ImageSyncManager::cached_not_found_locked(const Key& key) const {
    auto it = not_found_until_.find(key);
    return it != not_found_until_.end() && Timestamp::now() < it->second;
}

void ImageSyncManager::prune_not_found_locked(Timestamp now) {
    for (auto it = not_found_until_.begin(); it != not_found_until_.end();) {
        if (it->second <= now) {
            it = not_found_until_.erase(it);
        } else {
            ++it;
        }
    }
}

QFuture<DownloadOutcome> ImageSyncManager::download_from_cloud_async(const Uuid& id, Partition partition) {
    const Key key{id, partition};
    
    QMutexLocker lock(&mutex_);
    if (cached_not_found_locked(key)) {
        ++stats_.negative_cache_hits;
        qCDebug(ladleImagesLog) << "Not-found cache hit for" << describe(id, partition);
        return ready_future(DownloadOutcome{.status = DownloadOutcome::Status::NotFound});
    }
    
    auto it = in_flight_.find(key);
    if (it != in_flight_.end()) {
        ++stats_.downloads_coalesced;
        return it->second.future;
    }
    
    // The task removes its own entry under this mutex, so it cannot finish
    // bookkeeping before the entry below exists.
    const auto generation = ++next_generation_;
    ++stats_.downloads_started;
    auto future = QtConcurrent::run(&pool_, [this, id, partition, generation] {
        return run_download(id, partition, generation);
    });
    in_flight_[key] = InFlight{future, generation};
    return future;
}

DownloadOutcome ImageSyncManager::run_download(const Uuid& id, Partition partition, uint64_t generation) {
    const Key key{id, partition};
    DownloadOutcome outcome;
    
    auto downloaded = ops_.download(id, partition);
    if (downloaded.is_err()) {
        qCWarning(ladleImagesLog) << "Download failed for" << describe(id, partition) << ":"
                                  << QString::fromStdString(downloaded.unwrap_err().message);
        outcome.error = downloaded.unwrap_err();
    } else if (!downloaded.unwrap()) {
        outcome.status = DownloadOutcome::Status::NotFound;
    } else {
        auto written = write_file(id, *downloaded.unwrap());
        if (written.is_err()) {
            outcome.error = written.unwrap_err();
        } else {
            outcome.status = DownloadOutcome::Status::Downloaded;
        }
    }
    
    QMutexLocker lock(&mutex_);
    const auto now = Timestamp::now();
    prune_not_found_locked(now);
    if (outcome.status == DownloadOutcome::Status::NotFound && not_found_ttl_.count() > 0) {
        not_found_until_[key] = now + not_found_ttl_;
    }
    auto it = in_flight_.find(key);
    if (it != in_flight_.end() && it->second.generation == generation) {
        in_flight_.erase(it);
    }
    return outcome;
}

Res<bool> ImageSyncManager::download_from_cloud(const Uuid& id, Partition partition) {
    auto future = download_from_cloud_async(id, partition);
    future.waitForFinished();
    return future.result().to_result();
}

Res<void> ImageSyncManager::delete_from_cloud(const Uuid& id, Partition partition) {
    auto deleted = ignore_not_found(ops_.remove(id, partition));
    if (deleted.is_err()) {
        qCWarning(ladleImagesLog) << "Remote delete failed for" << describe(id, partition) << ":"
                                  << QString::fromStdString(deleted.unwrap_err().message);
    }
    return deleted;
}

// ============================================================================
// Bookkeeping
// ============================================================================

bool ImageSyncManager::note_upload_failure(const Uuid& id, const Error& error) {
    if (!is_retryable(error)) {
        if (pending_uploads_.contains(id)) {
            qCWarning(ladleImagesLog) << "Not retrying upload for" << to_qstring(id) << ":"
                                      << to_string(error.kind);
        }
        pending_uploads_.clear(id);
        return false;
    }
    const bool still_pending = pending_uploads_.record_failure(id);
    if (!still_pending) {
        qCWarning(ladleImagesLog) << "Giving up on upload for" << to_qstring(id) << "after"
                                  << pending_uploads_.max_attempts() << "attempts";
    }
    return still_pending;
}

std::optional<ImageSyncState> ImageSyncManager::sync_state(
    const Uuid& id, std::optional<Timestamp> remote_asset_modified_at
) const {
    const auto local = modification_time(id);
    if (!local) {
        if (remote_asset_modified_at) return ImageSyncState::DownloadPending;
        return std::nullopt;
    }
    if (pending_uploads_.contains(id)) return ImageSyncState::UploadPending;
    if (!remote_asset_modified_at) return ImageSyncState::LocalOnly;
    if (*local > *remote_asset_modified_at) return ImageSyncState::UploadPending;
    return ImageSyncState::Synced;
}

bool ImageSyncManager::is_cached_not_found(const Uuid& id, Partition partition) const {
    QMutexLocker lock(&mutex_);
    return cached_not_found_locked(Key{id, partition});
}

void ImageSyncManager::clear_not_found_cache(const Uuid& id) {
    QMutexLocker lock(&mutex_);
    not_found_until_.erase(Key{id, Partition::Private});
    not_found_until_.erase(Key{id, Partition::Public});
}

void ImageSyncManager::clear_all_not_found_cache() {
    QMutexLocker lock(&mutex_);
    not_found_until_.clear();
}

size_t ImageSyncManager::not_found_cache_size() const {
    QMutexLocker lock(&mutex_);
    return not_found_until_.size();
}

ImageSyncManager::Stats ImageSyncManager::stats() const {
    QMutexLocker lock(&mutex_);
    return stats_;
}

void ImageSyncManager::wait_for_downloads() {
    std::vector<QFuture<DownloadOutcome>> pending;
    {
        QMutexLocker lock(&mutex_);
        for (const auto& [key, entry] : in_flight_) {
            pending.push_back(entry.future);
        }
    }
    for (auto& future : pending) {
        future.waitForFinished();
    }
}

} // namespace ladle::sync
