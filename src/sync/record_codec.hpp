#pragma once

#include "core/collection.hpp"
#include "core/connection.hpp"
#include "core/recipe.hpp"
#include "core/result.hpp"
#include "core/user.hpp"
#include "sync/remote_store.hpp"

namespace ladle::sync {

/**
 * Conversions between local entities and remote records.
 *
 * Record ids are the entity id string. Local-only fields (Recipe::is_favorite)
 * are never written. Decoding fails with ErrorKind::InvalidData when the
 * record type, id or a required field does not match.
 */

[[nodiscard]] RemoteRecord to_record(const Recipe& recipe);
[[nodiscard]] RemoteRecord to_record(const Collection& collection);
[[nodiscard]] RemoteRecord to_record(const Connection& connection);
[[nodiscard]] RemoteRecord to_record(const User& user);

[[nodiscard]] Res<Recipe> recipe_from_record(const RemoteRecord& record);
[[nodiscard]] Res<Collection> collection_from_record(const RemoteRecord& record);
[[nodiscard]] Res<Connection> connection_from_record(const RemoteRecord& record);
[[nodiscard]] Res<User> user_from_record(const RemoteRecord& record);

/** updated_at carried in the record payload, if readable. */
[[nodiscard]] std::optional<Timestamp> record_updated_at(const RemoteRecord& record);

} // namespace ladle::sync
