#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <optional>
#include <string>
#include <vector>

namespace ladle::sync {

/**
 * Partition - The two namespaces of the remote object store.
 *
 * Private holds the owner's backup of everything; Public holds copies of
 * entities other users may read.
 */
enum class Partition {
    Private,
    Public
};

[[nodiscard]] constexpr const char* to_string(Partition partition) noexcept {
    return partition == Partition::Public ? "public" : "private";
}

/**
 * RemoteRecord - One entity record as stored remotely.
 */
struct RemoteRecord {
    std::string record_type;
    std::string record_id;
    QJsonObject fields;
    Timestamp modified_at;
};

/**
 * FieldMatch - Equality filter on a top-level string field of a record.
 */
struct FieldMatch {
    std::string field;
    std::string value;
};

/**
 * RemoteStore - Client interface of the remote object store.
 *
 * Calls block and are only made from background workers. Errors use
 * ErrorKind::NetworkUnavailable when the store cannot be reached,
 * QuotaExceeded when the account is out of space, Conflict for a
 * concurrent write, and NotFound for deletes of missing objects.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;
    
    /** Network and account reachability. */
    [[nodiscard]] virtual bool is_available() = 0;
    
    /** Insert or overwrite a record. Returns the stored record with its server time. */
    [[nodiscard]] virtual Res<RemoteRecord> save_record(Partition partition, const RemoteRecord& record) = 0;
    
    [[nodiscard]] virtual Res<std::optional<RemoteRecord>> fetch_record(
        Partition partition, const std::string& record_type, const std::string& record_id) = 0;
    
    [[nodiscard]] virtual Res<std::vector<RemoteRecord>> query_records(
        Partition partition, const std::string& record_type,
        const std::optional<FieldMatch>& match = std::nullopt) = 0;
    
    [[nodiscard]] virtual Res<void> delete_record(
        Partition partition, const std::string& record_type, const std::string& record_id) = 0;
    
    /** Store image/jpeg bytes under asset_id. Returns the remote asset record id. */
    [[nodiscard]] virtual Res<std::string> upload_asset(
        Partition partition, const std::string& asset_id, const QByteArray& data) = 0;
    
    /** nullopt when no asset exists under asset_id. */
    [[nodiscard]] virtual Res<std::optional<QByteArray>> download_asset(
        Partition partition, const std::string& asset_id) = 0;
    
    [[nodiscard]] virtual Res<void> delete_asset(Partition partition, const std::string& asset_id) = 0;
};

/** Asset id of the image attached to an entity: "<RecordType>Image-<id>". */
[[nodiscard]] inline std::string asset_id_for(const std::string& record_type, const Uuid& id) {
    return record_type + "Image-" + id.to_string();
}

/** Remote deletes treat an already-missing object as done. */
[[nodiscard]] inline Res<void> ignore_not_found(Res<void> result) {
    if (result.is_err() && result.unwrap_err().kind == ErrorKind::NotFound) {
        return Res<void>::ok();
    }
    return result;
}

} // namespace ladle::sync
