#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace corelay {

// Column value as stored by SQLite
using column_value_t = std::variant<std::nullptr_t, int64_t, double, std::string, std::vector<uint8_t>>;

// Result row keyed by column name
using row_t = std::unordered_map<std::string, column_value_t>;

/// Prepared statement. Finalized when destroyed.
class statement {
public:
    statement(sqlite3* db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    /// Binds `params` to the placeholders, in order.
    void bind(const std::vector<column_value_t>& params);

    /// Advances to the next row. Returns false when the statement is done.
    bool step();

    row_t row() const;

private:
    column_value_t column(int index) const;

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

/// Single SQLite connection.
class database {
public:
    enum class access {
        read_write,  ///< created if missing
        read_only    ///< the file must exist
    };

    explicit database(std::string path, access mode = access::read_write);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name);

    std::vector<row_t> query(const std::string& sql, const std::vector<column_value_t>& params = {});
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {});

    void begin_transaction();
    void commit();
    void rollback();
    bool in_transaction() const;

    bool read_only() const { return mode_ == access::read_only; }
    const std::string& path() const { return path_; }

private:
    void exec_script(const std::string& sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    access mode_;
};

/// Rolls back on destruction unless committed.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace corelay

#endif // __cplusplus
