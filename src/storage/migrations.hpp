#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>
#include <functional>

namespace ladle::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "entity_tables",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS recipes (
                id TEXT PRIMARY KEY,
                title TEXT NOT NULL,
                ingredients_json TEXT NOT NULL DEFAULT '[]',
                steps_json TEXT NOT NULL DEFAULT '[]',
                tags_json TEXT NOT NULL DEFAULT '[]',
                yields TEXT NOT NULL DEFAULT '',
                total_minutes INTEGER,
                notes TEXT NOT NULL DEFAULT '',
                source_url TEXT NOT NULL DEFAULT '',
                image_filename TEXT,
                is_favorite INTEGER NOT NULL DEFAULT 0,
                visibility TEXT NOT NULL DEFAULT 'private',
                owner_id TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_recipes_owner ON recipes(owner_id);
            CREATE INDEX IF NOT EXISTS idx_recipes_updated ON recipes(updated_at);
            
            CREATE TABLE IF NOT EXISTS collections (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                user_id TEXT NOT NULL,
                recipe_ids_json TEXT NOT NULL DEFAULT '[]',
                visibility TEXT NOT NULL DEFAULT 'private',
                emoji TEXT,
                color TEXT,
                cover_image_filename TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_collections_user ON collections(user_id);
            
            CREATE TABLE IF NOT EXISTS users (
                id TEXT PRIMARY KEY,
                username TEXT NOT NULL,
                display_name TEXT NOT NULL,
                email TEXT,
                profile_emoji TEXT,
                profile_color TEXT,
                profile_image_filename TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_users_username ON users(username);
            
            CREATE TABLE IF NOT EXISTS connections (
                id TEXT PRIMARY KEY,
                from_user_id TEXT NOT NULL,
                to_user_id TEXT NOT NULL,
                status TEXT NOT NULL DEFAULT 'pending',
                from_username TEXT,
                from_display_name TEXT,
                to_username TEXT,
                to_display_name TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_connections_from ON connections(from_user_id);
            CREATE INDEX IF NOT EXISTS idx_connections_to ON connections(to_user_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS connections;
            DROP TABLE IF EXISTS users;
            DROP TABLE IF EXISTS collections;
            DROP TABLE IF EXISTS recipes;
        )SQL"
    },
    {
        .version = 2,
        .name = "sync_control_tables",
        .up_sql = R"SQL(
            -- Locally deleted ids; remote copies of these must never be re-inserted
            CREATE TABLE IF NOT EXISTS tombstones (
                entity_id TEXT PRIMARY KEY,
                entity_kind TEXT NOT NULL,
                deleted_at INTEGER NOT NULL,
                remote_record_id TEXT
            );
            CREATE INDEX IF NOT EXISTS idx_tombstones_deleted_at ON tombstones(deleted_at);
            
            CREATE TABLE IF NOT EXISTS sync_operations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                entity_kind TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                op_kind TEXT NOT NULL,
                status TEXT NOT NULL DEFAULT 'queued',
                attempts INTEGER NOT NULL DEFAULT 0,
                last_error TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                UNIQUE(entity_kind, entity_id, op_kind)
            );
            CREATE INDEX IF NOT EXISTS idx_sync_operations_status ON sync_operations(status);
            CREATE INDEX IF NOT EXISTS idx_sync_operations_entity ON sync_operations(entity_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_operations;
            DROP TABLE IF EXISTS tombstones;
        )SQL"
    },
    {
        .version = 3,
        .name = "remote_sync_state",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS remote_sync_state (
                entity_kind TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                remote_record_id TEXT,
                public_record_id TEXT,
                remote_asset_record_id TEXT,
                remote_asset_modified_at INTEGER,
                public_asset_modified_at INTEGER,
                last_synced_at INTEGER,
                PRIMARY KEY (entity_kind, entity_id)
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS remote_sync_state;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}
    
    /** Apply every migration newer than the current version. */
    [[nodiscard]] Result<void, Error> migrate();
    
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);
    
    /** Revert the newest applied migration. */
    [[nodiscard]] Result<void, Error> rollback();
    
    /** Revert applied migrations newer than target_version, newest first. */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);
    
    /** 0 on a fresh database. */
    [[nodiscard]] Result<int, Error> current_version();
    
    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    enum class Direction { Up, Down };
    
    Database& db_;
    
    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> step(const Migration& m, Direction direction);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace ladle::storage

