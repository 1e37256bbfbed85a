#pragma once

#include "storage/database.hpp"
#include <optional>
#include <string>

namespace ladle::storage {

/**
 * Read a UUID column. A malformed id means the row was written by
 * something other than this code and is reported as InvalidData.
 */
[[nodiscard]] inline Result<Uuid, Error> column_uuid(const Statement& stmt, int index) {
    auto text = stmt.column_text(index);
    auto id = Uuid::parse(text);
    if (!id) {
        return Result<Uuid, Error>::err(
            Error{ErrorKind::InvalidData, "Malformed id in column " + std::to_string(index) + ": " + text});
    }
    return Result<Uuid, Error>::ok(*id);
}

[[nodiscard]] inline std::optional<Timestamp> column_optional_timestamp(const Statement& stmt, int index) {
    auto millis = stmt.column_optional_int64(index);
    if (!millis) return std::nullopt;
    return Timestamp(*millis);
}

[[nodiscard]] inline std::optional<int64_t> optional_millis(const std::optional<Timestamp>& ts) {
    if (!ts) return std::nullopt;
    return ts->millis();
}

/**
 * Step through every row of a prepared statement, mapping each with
 * `map_row` (which returns a Result) and collecting the values.
 */
template<typename T, typename F>
[[nodiscard]] Result<std::vector<T>, Error> collect_rows(Statement& stmt, F&& map_row) {
    std::vector<T> rows;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<T>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        
        auto row = map_row(stmt);
        if (row.is_err()) {
            return Result<std::vector<T>, Error>::err(row.unwrap_err());
        }
        rows.push_back(std::move(row).unwrap());
    }
    return Result<std::vector<T>, Error>::ok(std::move(rows));
}

/**
 * Prepare `sql`, bind `args`, and collect all rows through `map_row`.
 */
template<typename T, typename F, typename... Args>
[[nodiscard]] Result<std::vector<T>, Error> select_rows(
    Database& db, const std::string& sql, F&& map_row, const Args&... args) {
    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::vector<T>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(args...);
    if (bind_result.is_err()) {
        return Result<std::vector<T>, Error>::err(bind_result.unwrap_err());
    }
    return collect_rows<T>(stmt, std::forward<F>(map_row));
}

/**
 * Like select_rows, for queries expected to return zero or one row.
 */
template<typename T, typename F, typename... Args>
[[nodiscard]] Result<std::optional<T>, Error> select_one(
    Database& db, const std::string& sql, F&& map_row, const Args&... args) {
    auto rows = select_rows<T>(db, sql, std::forward<F>(map_row), args...);
    if (rows.is_err()) {
        return Result<std::optional<T>, Error>::err(rows.unwrap_err());
    }
    auto& values = rows.unwrap();
    if (values.empty()) {
        return Result<std::optional<T>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<T>, Error>::ok(std::move(values.front()));
}

} // namespace ladle::storage
