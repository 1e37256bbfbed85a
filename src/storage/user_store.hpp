#pragma once

#include "storage/database.hpp"
#include "core/user.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace ladle::storage {

/**
 * UserStore - Data access layer for cached user profiles.
 */
class UserStore {
public:
    explicit UserStore(Database& db) : db_(db) {}
    
    [[nodiscard]] Result<std::optional<User>, Error> get(const Uuid& id);
    [[nodiscard]] Result<std::optional<User>, Error> find_by_username(const std::string& username);
    [[nodiscard]] Result<std::vector<User>, Error> list_all();
    [[nodiscard]] Result<void, Error> save(const User& user);
    [[nodiscard]] Result<bool, Error> remove(const Uuid& id);

private:
    Database& db_;
    
    [[nodiscard]] static Result<User, Error> row_to_user(const Statement& stmt);
};

} // namespace ladle::storage
