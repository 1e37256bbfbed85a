#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"
#include <QMutex>
#include <QMutexLocker>
#include <memory>
#include <string>

namespace ladle::sync {

/**
 * LocalStore - The single local database shared by every repository.
 *
 * Owns the connection and serializes access to it: callers borrow the
 * Database only for the duration of with_db(). Never make a remote call
 * from inside with_db().
 */
class LocalStore {
public:
    /** Open (creating if needed) and migrate the database at path. */
    [[nodiscard]] static Res<std::unique_ptr<LocalStore>> open(const std::string& path);
    
    /** Open a migrated in-memory database. */
    [[nodiscard]] static Res<std::unique_ptr<LocalStore>> open_memory();
    
    template<typename F>
    decltype(auto) with_db(F&& fn) {
        QMutexLocker lock(&mutex_);
        return fn(db_);
    }

private:
    explicit LocalStore(storage::Database db) : db_(std::move(db)) {}
    
    [[nodiscard]] static Res<std::unique_ptr<LocalStore>> adopt(Res<storage::Database> opened);
    
    QMutex mutex_;
    storage::Database db_;
};

} // namespace ladle::sync
