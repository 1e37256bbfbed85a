#include "storage/database.hpp"

namespace ladle::storage {

namespace {

constexpr int kBusyTimeoutMs = 5000;

Error sqlite_error(sqlite3* db, const std::string& what, int rc) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return Error{what + ": " + detail, rc, ErrorKind::Storage};
}

} // namespace

// ============================================================================
// Statement
// ============================================================================

Res<void> Statement::check_bind(int rc, int index) const {
    if (rc != SQLITE_OK) {
        return Res<void>::err(sqlite_error(sqlite3_db_handle(stmt_.get()),
                                           "Cannot bind parameter " + std::to_string(index), rc));
    }
    return Res<void>::ok();
}

Res<void> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      index);
}

Res<void> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), index);
}

Res<void> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), index);
}

std::string Statement::column_text(int index) const {
    const auto* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::optional<int64_t> Statement::column_optional_int64(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_int64(index);
}

Res<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    switch (rc) {
        case SQLITE_ROW: return Res<bool>::ok(true);
        case SQLITE_DONE: return Res<bool>::ok(false);
        default: return Res<bool>::err(sqlite_error(sqlite3_db_handle(stmt_.get()), "Step failed", rc));
    }
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Res<Database> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        auto error = sqlite_error(raw, "Cannot open " + path, rc);
        sqlite3_close(raw);
        return Res<Database>::err(std::move(error));
    }
    
    Database database(raw);
    for (const char* pragma : {"PRAGMA foreign_keys = ON;", "PRAGMA journal_mode = WAL;"}) {
        auto applied = database.execute(pragma);
        if (applied.is_err()) {
            return Res<Database>::err(applied.unwrap_err());
        }
    }
    // The CLI may read while the app writes.
    sqlite3_busy_timeout(raw, kBusyTimeoutMs);
    return Res<Database>::ok(std::move(database));
}

Res<Database> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Res<Statement> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Res<Statement>::err(sqlite_error(db_, "Cannot prepare statement", rc));
    }
    return Res<Statement>::ok(Statement(stmt));
}

Res<void> Database::execute(const std::string& sql) {
    char* message = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string text = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        return Res<void>::err(Error{text, rc, ErrorKind::Storage});
    }
    return Res<void>::ok();
}

Res<void> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE;");
}

Res<void> Database::commit() {
    return execute("COMMIT;");
}

Res<void> Database::rollback() {
    return execute("ROLLBACK;");
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace ladle::storage
