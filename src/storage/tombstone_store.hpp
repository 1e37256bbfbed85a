#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <chrono>
#include <optional>
#include <vector>

namespace ladle::storage {

/**
 * TombstoneStore - Authoritative record of locally deleted entity ids.
 *
 * Any pull path must consult is_deleted() before materializing a remote
 * record, otherwise a stale remote copy resurrects the entity.
 */
class TombstoneStore {
public:
    explicit TombstoneStore(Database& db) : db_(db) {}
    
    /**
     * Record a deletion. A no-op when a tombstone for entity_id already
     * exists; the original deleted_at is kept. Returns whether a new
     * tombstone was written.
     */
    [[nodiscard]] Result<bool, Error> mark_deleted(
        EntityKind kind,
        const Uuid& entity_id,
        const std::optional<std::string>& remote_record_id,
        Timestamp deleted_at = Timestamp::now());
    
    [[nodiscard]] Result<bool, Error> is_deleted(const Uuid& entity_id);
    
    /** Remove the tombstone. Used when the user deliberately re-creates the id. */
    [[nodiscard]] Result<bool, Error> unmark(const Uuid& entity_id);
    
    [[nodiscard]] Result<std::optional<Tombstone>, Error> get(const Uuid& entity_id);
    
    /** All tombstones, newest first. */
    [[nodiscard]] Result<std::vector<Tombstone>, Error> list();
    
    /**
     * Drop tombstones with deleted_at older than now - retention.
     * Returns the number removed.
     */
    [[nodiscard]] Result<int, Error> cleanup(
        std::chrono::milliseconds retention,
        Timestamp now = Timestamp::now());

private:
    Database& db_;
};

} // namespace ladle::storage
