#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ladle::storage {

/**
 * Statement - A prepared SQLite statement, finalized when the last copy goes.
 *
 * Parameters are bound by position through bind_value() overloads, so row
 * types can be written with bind_all(id, title, maybe_minutes, ...).
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}
    
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }
    
    Res<void> bind_text(int index, std::string_view text);
    Res<void> bind_int64(int index, int64_t value);
    Res<void> bind_null(int index);
    
    Res<void> bind_value(int index, const std::string& v) { return bind_text(index, v); }
    Res<void> bind_value(int index, std::string_view v) { return bind_text(index, v); }
    Res<void> bind_value(int index, const char* v) { return bind_text(index, v); }
    Res<void> bind_value(int index, int v) { return bind_int64(index, v); }
    Res<void> bind_value(int index, int64_t v) { return bind_int64(index, v); }
    Res<void> bind_value(int index, bool v) { return bind_int64(index, v ? 1 : 0); }
    Res<void> bind_value(int index, std::nullopt_t) { return bind_null(index); }
    
    template<typename T>
    Res<void> bind_value(int index, const std::optional<T>& v) {
        return v ? bind_value(index, *v) : bind_null(index);
    }
    
    /** Bind args to parameters 1..N. Stops at the first failure. */
    template<typename... Args>
    Res<void> bind_all(const Args&... args) {
        auto result = Res<void>::ok();
        int index = 1;
        ((result.is_ok() ? (result = bind_value(index++, args), 0) : 0), ...);
        return result;
    }
    
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::optional<int64_t> column_optional_int64(int index) const;
    
    /** ok(true) when a row is available. */
    Res<bool> step();

private:
    [[nodiscard]] Res<void> check_bind(int rc, int index) const;
    
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - One SQLite connection.
 *
 * Not thread-safe on its own; it is shared across threads only through
 * LocalStore, which serializes access.
 */
class Database {
public:
    Database() = default;
    ~Database();
    
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    
    /** Open (creating if needed) with foreign keys on and WAL journaling. */
    [[nodiscard]] static Res<Database> open(const std::string& path);
    [[nodiscard]] static Res<Database> open_memory();
    
    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();
    
    [[nodiscard]] Res<Statement> prepare(const std::string& sql);
    
    /** Run one or more statements that return no rows. */
    [[nodiscard]] Res<void> execute(const std::string& sql);
    
    /** Prepare, bind and step one statement. Returns the number of rows changed. */
    template<typename... Args>
    [[nodiscard]] Res<int> run(const std::string& sql, const Args&... args) {
        auto prepared = prepare(sql);
        if (prepared.is_err()) {
            return Res<int>::err(prepared.unwrap_err());
        }
        auto stmt = std::move(prepared).unwrap();
        auto bound = stmt.bind_all(args...);
        if (bound.is_err()) {
            return Res<int>::err(bound.unwrap_err());
        }
        auto stepped = stmt.step();
        if (stepped.is_err()) {
            return Res<int>::err(stepped.unwrap_err());
        }
        return Res<int>::ok(changes());
    }
    
    /** Call callback(stmt) for every row. Trailing args are bound in order. */
    template<typename F, typename... Args>
    [[nodiscard]] Res<void> query(const std::string& sql, F&& callback, const Args&... args) {
        auto prepared = prepare(sql);
        if (prepared.is_err()) {
            return Res<void>::err(prepared.unwrap_err());
        }
        auto stmt = std::move(prepared).unwrap();
        auto bound = stmt.bind_all(args...);
        if (bound.is_err()) {
            return bound;
        }
        while (true) {
            auto row = stmt.step();
            if (row.is_err()) {
                return Res<void>::err(row.unwrap_err());
            }
            if (!row.unwrap()) break;
            callback(stmt);
        }
        return Res<void>::ok();
    }
    
    [[nodiscard]] Res<void> begin_transaction();
    [[nodiscard]] Res<void> commit();
    [[nodiscard]] Res<void> rollback();
    
    /**
     * Run f inside a transaction: commit when it returns ok, roll back when
     * it returns an error. f returns some Res<T>.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());
        
        auto begun = begin_transaction();
        if (begun.is_err()) {
            return ResultType::err(begun.unwrap_err());
        }
        
        auto result = f();
        if (result.is_err()) {
            auto rolled_back = rollback();
            if (rolled_back.is_err()) {
                return ResultType::err(Error{
                    result.unwrap_err().message + " (rollback failed: " + rolled_back.unwrap_err().message + ")",
                    rolled_back.unwrap_err().code, ErrorKind::Storage});
            }
            return result;
        }
        
        auto committed = commit();
        if (committed.is_err()) {
            return ResultType::err(committed.unwrap_err());
        }
        return result;
    }
    
    [[nodiscard]] int64_t last_insert_rowid() const;
    
    /** Rows changed by the most recent statement. */
    [[nodiscard]] int changes() const;
    
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}
    
    sqlite3* db_ = nullptr;
};

} // namespace ladle::storage
