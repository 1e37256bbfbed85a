#pragma once

#include <QString>
#include <chrono>
#include <cstdint>

namespace ladle::sync {

/**
 * SyncConfig - Tunables of the propagation layer.
 *
 * Defaults match production behaviour; load() applies QSettings overrides.
 */
struct SyncConfig {
    std::chrono::seconds retry_base{120};
    std::chrono::seconds retry_max{3600};
    int max_attempts{10};
    std::chrono::days tombstone_retention{30};
    std::chrono::seconds not_found_ttl{300};
    
    /** Defaults overridden by any values stored under sync/ in QSettings. */
    [[nodiscard]] static SyncConfig load();
    
    /** Clamp every field into its accepted range. */
    [[nodiscard]] SyncConfig normalized() const;
    
    void save() const;
    
    bool operator==(const SyncConfig&) const = default;
};

/**
 * ImageConfig - Storage and compression parameters for one entity kind.
 */
struct ImageConfig {
    QString directory;
    int max_dimension{2000};
    int64_t target_bytes{5'000'000};
    int64_t ceiling_bytes{kAbsoluteCeilingBytes};
    
    static constexpr int64_t kAbsoluteCeilingBytes = 10'000'000;
    
    [[nodiscard]] static ImageConfig recipe();
    [[nodiscard]] static ImageConfig collection();
    [[nodiscard]] static ImageConfig profile();
};

/** LADLE_DATA_DIR, else the platform app data location. */
[[nodiscard]] QString data_directory();

/** LADLE_DB_PATH, else <data dir>/ladle.db. */
[[nodiscard]] QString database_path();

} // namespace ladle::sync
