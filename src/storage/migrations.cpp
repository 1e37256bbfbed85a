#include "storage/migrations.hpp"

namespace ladle::storage {

namespace {

Error migration_error(const Migration& m, const char* action, const Error& cause) {
    return Error{"Migration " + std::to_string(m.version) + " (" + m.name + ") " + action + ": " +
                     cause.message,
                 cause.code, ErrorKind::Storage};
}

} // namespace

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) {
        return Res<int>::err(ensured.unwrap_err());
    }
    
    auto stmt = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (stmt.is_err()) {
        return Res<int>::err(stmt.unwrap_err());
    }
    auto query = std::move(stmt).unwrap();
    auto row = query.step();
    if (row.is_err()) {
        return Res<int>::err(row.unwrap_err());
    }
    return Res<int>::ok(query.column_int(0));
}

Result<void, Error> MigrationRunner::step(const Migration& m, Direction direction) {
    if (direction == Direction::Up) {
        auto applied = db_.execute(m.up_sql);
        if (applied.is_err()) {
            return Res<void>::err(migration_error(m, "failed", applied.unwrap_err()));
        }
        auto recorded = db_.run(
            "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);",
            m.version, m.name, Timestamp::now().millis());
        if (recorded.is_err()) {
            return Res<void>::err(recorded.unwrap_err());
        }
        return Res<void>::ok();
    }
    
    if (m.down_sql.empty()) {
        return Res<void>::err(Error{ErrorKind::Storage,
                                    "Migration " + std::to_string(m.version) + " cannot be reverted"});
    }
    auto reverted = db_.execute(m.down_sql);
    if (reverted.is_err()) {
        return Res<void>::err(migration_error(m, "could not be reverted", reverted.unwrap_err()));
    }
    auto forgotten = db_.run("DELETE FROM schema_migrations WHERE version = ?;", m.version);
    if (forgotten.is_err()) {
        return Res<void>::err(forgotten.unwrap_err());
    }
    return Res<void>::ok();
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto version = current_version();
    if (version.is_err()) {
        return Res<void>::err(version.unwrap_err());
    }
    const int current = version.unwrap();
    if (current >= target_version) {
        return Res<void>::ok();
    }
    
    return db_.transaction([&]() -> Res<void> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= current || m.version > target_version) continue;
            auto stepped = step(m, Direction::Up);
            if (stepped.is_err()) return stepped;
        }
        return Res<void>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback() {
    auto version = current_version();
    if (version.is_err()) {
        return Res<void>::err(version.unwrap_err());
    }
    return version.unwrap() == 0 ? Res<void>::ok() : rollback_to(version.unwrap() - 1);
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto version = current_version();
    if (version.is_err()) {
        return Res<void>::err(version.unwrap_err());
    }
    const int current = version.unwrap();
    if (current <= target_version) {
        return Res<void>::ok();
    }
    
    return db_.transaction([&]() -> Res<void> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version > current || it->version <= target_version) continue;
            auto stepped = step(*it, Direction::Down);
            if (stepped.is_err()) return stepped;
        }
        return Res<void>::ok();
    });
}

} // namespace ladle::storage
