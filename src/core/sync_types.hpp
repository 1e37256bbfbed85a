#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ladle {

/**
 * EntityKind - The kinds of entity the sync engine replicates.
 */
enum class EntityKind {
    Recipe,
    Collection,
    Connection,
    User
};

enum class OpKind {
    Create,
    Update,
    Delete
};

/**
 * OpStatus - queued -> in_progress -> {completed | failed}.
 */
enum class OpStatus {
    Queued,
    InProgress,
    Completed,
    Failed
};

[[nodiscard]] std::string to_string(EntityKind kind);
[[nodiscard]] std::string to_string(OpKind kind);
[[nodiscard]] std::string to_string(OpStatus status);

[[nodiscard]] std::optional<EntityKind> entity_kind_from_string(std::string_view s);
[[nodiscard]] std::optional<OpKind> op_kind_from_string(std::string_view s);
[[nodiscard]] std::optional<OpStatus> op_status_from_string(std::string_view s);

/**
 * Record type name used for this kind in the remote store ("Recipe", ...).
 */
[[nodiscard]] std::string remote_record_type(EntityKind kind);

/**
 * SyncOperation - One durable row of the propagation log.
 *
 * Carries no payload: executing an operation re-reads the current local
 * state of the entity.
 */
struct SyncOperation {
    int64_t id{0};
    EntityKind entity_kind{EntityKind::Recipe};
    Uuid entity_id;
    OpKind op_kind{OpKind::Create};
    OpStatus status{OpStatus::Queued};
    int attempts{0};
    std::optional<std::string> last_error;
    Timestamp created_at;
    Timestamp updated_at;
    
    bool operator==(const SyncOperation&) const = default;
};

/**
 * Tombstone - Marker for a locally deleted entity.
 */
struct Tombstone {
    Uuid entity_id;
    EntityKind entity_kind{EntityKind::Recipe};
    Timestamp deleted_at;
    std::optional<std::string> remote_record_id;
    
    bool operator==(const Tombstone&) const = default;
};

/**
 * RemoteSyncState - Remote-side metadata for an entity, kept apart from the
 * entity payload and joined by (kind, id).
 */
struct RemoteSyncState {
    EntityKind entity_kind{EntityKind::Recipe};
    Uuid entity_id;
    std::optional<std::string> remote_record_id;
    std::optional<std::string> public_record_id;
    std::optional<std::string> remote_asset_record_id;
    std::optional<Timestamp> remote_asset_modified_at;
    std::optional<Timestamp> public_asset_modified_at;
    std::optional<Timestamp> last_synced_at;
    
    bool operator==(const RemoteSyncState&) const = default;
};

} // namespace ladle
