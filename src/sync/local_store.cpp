#include "sync/local_store.hpp"
#include "storage/migrations.hpp"
#include "sync/log.hpp"

namespace ladle::sync {

Res<std::unique_ptr<LocalStore>> LocalStore::adopt(Res<storage::Database> opened) {
    if (opened.is_err()) {
        return Res<std::unique_ptr<LocalStore>>::err(opened.unwrap_err());
    }
    auto db = std::move(opened).unwrap();
    
    auto migrated = storage::initialize_database(db);
    if (migrated.is_err()) {
        qCWarning(ladleSyncLog) << "Database migration failed:"
                                << QString::fromStdString(migrated.unwrap_err().message);
        return Res<std::unique_ptr<LocalStore>>::err(migrated.unwrap_err());
    }
    
    return Res<std::unique_ptr<LocalStore>>::ok(
        std::unique_ptr<LocalStore>(new LocalStore(std::move(db))));
}

Res<std::unique_ptr<LocalStore>> LocalStore::open(const std::string& path) {
    return adopt(storage::Database::open(path));
}

Res<std::unique_ptr<LocalStore>> LocalStore::open_memory() {
    return adopt(storage::Database::open_memory());
}

} // namespace ladle::sync
