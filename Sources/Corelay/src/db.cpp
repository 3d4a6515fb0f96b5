#include "corelay/db.hpp"
#include "corelay/log.hpp"
#include <utility>

namespace corelay {

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
    if (sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt_);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql_.c_str());
        throw storage_error("Failed to prepare statement: " + error);
    }
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

void statement::bind(const std::vector<column_value_t>& params) {
    for (std::size_t i = 0; i < params.size(); ++i) {
        int slot = static_cast<int>(i) + 1;
        int rc = std::visit([&](auto&& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, slot);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, slot, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt_, slot, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(stmt_, slot, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            } else {
                // Zero-length blobs still need a non-null pointer
                return v.empty() ? sqlite3_bind_zeroblob(stmt_, slot, 0)
                                 : sqlite3_bind_blob(stmt_, slot, v.data(), static_cast<int>(v.size()),
                                                     SQLITE_TRANSIENT);
            }
        }, params[i]);
        if (rc != SQLITE_OK) {
            throw storage_error("Failed to bind parameter " + std::to_string(slot) + ": " +
                                sqlite3_errmsg(db_));
        }
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    std::string error = sqlite3_errmsg(db_);
    LOG_ERROR("db", "%s in %s", error.c_str(), sql_.c_str());
    throw storage_error("Statement failed: " + error);
}

column_value_t statement::column(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, index);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
            return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
        }
        case SQLITE_BLOB: {
            const auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
            return std::vector<uint8_t>(bytes, bytes + sqlite3_column_bytes(stmt_, index));
        }
        default:
            return nullptr;
    }
}

row_t statement::row() const {
    row_t result;
    int count = sqlite3_column_count(stmt_);
    for (int i = 0; i < count; ++i) {
        result.emplace(sqlite3_column_name(stmt_, i), column(i));
    }
    return result;
}

// ============================================================================
// database
// ============================================================================

database::database(std::string path, access mode) : path_(std::move(path)), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX |
                (mode == access::read_only ? SQLITE_OPEN_READONLY
                                           : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open %s: %s", path_.c_str(), error.c_str());
        throw storage_error("Failed to open database " + path_ + ": " + error);
    }

    // Rollback journal: read-only connections never need -wal/-shm files
    if (mode == access::read_write) {
        exec_script("PRAGMA journal_mode = DELETE");
    }
    exec_script("PRAGMA temp_store = MEMORY");
    sqlite3_busy_timeout(db_, 5000);
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void database::exec_script(const std::string& sql) {
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        throw storage_error("SQL execution failed: " + error);
    }
}

bool database::table_exists(const std::string& name) {
    return !query("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?", {name}).empty();
}

std::vector<row_t> database::query(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind(params);

    std::vector<row_t> rows;
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    return rows;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        exec_script(sql);
        return;
    }
    statement stmt(db_, sql);
    stmt.bind(params);
    while (stmt.step()) {
    }
}

void database::begin_transaction() {
    exec_script("BEGIN IMMEDIATE");
}

void database::commit() {
    exec_script("COMMIT");
}

void database::rollback() {
    exec_script("ROLLBACK");
}

bool database::in_transaction() const {
    // Autocommit is off while a transaction is open
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (completed_ || !db_.in_transaction()) return;
    try {
        db_.rollback();
    } catch (const storage_error& e) {
        LOG_ERROR("db", "Rollback failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace corelay
