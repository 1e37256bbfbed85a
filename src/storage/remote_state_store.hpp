#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/sync_types.hpp"
#include <optional>
#include <vector>

namespace ladle::storage {

/**
 * RemoteStateStore - Remote record and asset bookkeeping per entity.
 */
class RemoteStateStore {
public:
    explicit RemoteStateStore(Database& db) : db_(db) {}
    
    [[nodiscard]] Result<std::optional<RemoteSyncState>, Error> get(EntityKind kind, const Uuid& entity_id);
    
    /** Returns the stored state or a blank one keyed by (kind, entity_id). */
    [[nodiscard]] Result<RemoteSyncState, Error> get_or_default(EntityKind kind, const Uuid& entity_id);
    
    [[nodiscard]] Result<std::vector<RemoteSyncState>, Error> list(EntityKind kind);
    
    [[nodiscard]] Result<void, Error> save(const RemoteSyncState& state);
    
    [[nodiscard]] Result<bool, Error> remove(EntityKind kind, const Uuid& entity_id);

private:
    Database& db_;
};

} // namespace ladle::storage
