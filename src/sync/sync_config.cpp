#include "sync/sync_config.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>

namespace ladle::sync {

namespace {

constexpr const char* kSettingsRetryBase = "sync/retry_base_seconds";
constexpr const char* kSettingsRetryMax = "sync/retry_max_seconds";
constexpr const char* kSettingsMaxAttempts = "sync/max_attempts";
constexpr const char* kSettingsTombstoneRetention = "sync/tombstone_retention_days";
constexpr const char* kSettingsNotFoundTtl = "sync/not_found_ttl_seconds";

constexpr int64_t kMaxRetrySeconds = 24 * 60 * 60;
constexpr int kMaxAttemptsLimit = 100;
constexpr int kMaxRetentionDays = 365;
constexpr int64_t kMaxNotFoundTtlSeconds = 60 * 60;

int64_t read_int(QSettings& settings, const char* key, int64_t fallback) {
    bool ok = false;
    const auto value = settings.value(QString::fromLatin1(key), QVariant::fromValue(fallback)).toLongLong(&ok);
    return ok ? value : fallback;
}

} // namespace

SyncConfig SyncConfig::load() {
    const SyncConfig defaults;
    QSettings settings;
    SyncConfig config{
        .retry_base = std::chrono::seconds(read_int(settings, kSettingsRetryBase, defaults.retry_base.count())),
        .retry_max = std::chrono::seconds(read_int(settings, kSettingsRetryMax, defaults.retry_max.count())),
        .max_attempts = static_cast<int>(read_int(settings, kSettingsMaxAttempts, defaults.max_attempts)),
        .tombstone_retention = std::chrono::days(
            read_int(settings, kSettingsTombstoneRetention, defaults.tombstone_retention.count())),
        .not_found_ttl = std::chrono::seconds(read_int(settings, kSettingsNotFoundTtl, defaults.not_found_ttl.count()))
    };
    return config.normalized();
}

SyncConfig SyncConfig::normalized() const {
    SyncConfig out = *this;
    out.retry_base = std::chrono::seconds(std::clamp<int64_t>(retry_base.count(), 1, kMaxRetrySeconds));
    out.retry_max = std::chrono::seconds(
        std::clamp<int64_t>(retry_max.count(), out.retry_base.count(), kMaxRetrySeconds));
    out.max_attempts = std::clamp(max_attempts, 1, kMaxAttemptsLimit);
    out.tombstone_retention = std::chrono::days(
        std::clamp<int64_t>(tombstone_retention.count(), 1, kMaxRetentionDays));
    out.not_found_ttl = std::chrono::seconds(
        std::clamp<int64_t>(not_found_ttl.count(), 0, kMaxNotFoundTtlSeconds));
    return out;
}

void SyncConfig::save() const {
    QSettings settings;
    settings.setValue(QString::fromLatin1(kSettingsRetryBase), QVariant::fromValue<qint64>(retry_base.count()));
    settings.setValue(QString::fromLatin1(kSettingsRetryMax), QVariant::fromValue<qint64>(retry_max.count()));
    settings.setValue(QString::fromLatin1(kSettingsMaxAttempts), max_attempts);
    settings.setValue(QString::fromLatin1(kSettingsTombstoneRetention),
                      QVariant::fromValue<qint64>(tombstone_retention.count()));
    settings.setValue(QString::fromLatin1(kSettingsNotFoundTtl), QVariant::fromValue<qint64>(not_found_ttl.count()));
}

ImageConfig ImageConfig::recipe() {
    return ImageConfig{
        .directory = QStringLiteral("RecipeImages"),
        .max_dimension = 2000,
        .target_bytes = 5'000'000
    };
}

ImageConfig ImageConfig::collection() {
    return ImageConfig{
        .directory = QStringLiteral("CollectionImages"),
        .max_dimension = 1200,
        .target_bytes = 2'000'000
    };
}

ImageConfig ImageConfig::profile() {
    return ImageConfig{
        .directory = QStringLiteral("ProfileImages"),
        .max_dimension = 800,
        .target_bytes = 1'000'000
    };
}

QString data_directory() {
    const auto overrideDir = qEnvironmentVariable("LADLE_DATA_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString database_path() {
    const auto overridePath = qEnvironmentVariable("LADLE_DB_PATH");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    return QDir(data_directory()).filePath(QStringLiteral("ladle.db"));
}

} // namespace ladle::sync
