#include "../../include/database/db_connection.hpp"
#include "../../include/utils/logger.hpp"

#include <sqlite3.h>

namespace forumbot {

bool QueryResult::isNull(size_t row, size_t col) const {
    return std::holds_alternative<std::nullptr_t>(rows.at(row).at(col));
}

int64_t QueryResult::getInt(size_t row, size_t col) const {
    const SqlValue& v = rows.at(row).at(col);
    if (auto i = std::get_if<int64_t>(&v)) return *i;
    if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (auto s = std::get_if<std::string>(&v)) {
        if (s->empty()) return 0;
        try {
            return std::stoll(*s);
        } catch (const std::exception&) {
            throw DatabaseError("column " + columns.at(col) + " is not an integer: " + *s, SQLITE_MISMATCH);
        }
    }
    return 0;
}

std::string QueryResult::getText(size_t row, size_t col) const {
    const SqlValue& v = rows.at(row).at(col);
    if (auto s = std::get_if<std::string>(&v)) return *s;
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) return std::to_string(*d);
    return "";
}

DatabaseConnection::DatabaseConnection(const std::string& path, Mode mode)
    : path_(path), mode_(mode), db_(nullptr) {
}

DatabaseConnection::~DatabaseConnection() {
    close();
}

bool DatabaseConnection::isMemoryPath(const std::string& path) {
    return path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

bool DatabaseConnection::isMemory() const {
    return isMemoryPath(path_);
}

bool DatabaseConnection::open() {
    if (db_) {
        return true;
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        Logger::getInstance().error("Failed to open SQLite database " + path_ + ": " +
                                    (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        if (mode_ == Mode::ReadWrite && !isMemory()) {
            QueryResult jm = execute("PRAGMA journal_mode=WAL");
            if (jm.empty() || jm.getText(0, 0) != "wal") {
                Logger::getInstance().warning("SQLite WAL mode not enabled for " + path_);
            }
            execute("PRAGMA synchronous=NORMAL");
        }
        if (mode_ == Mode::ReadOnly) {
            execute("PRAGMA query_only=1");
        }
    } catch (const DatabaseError& e) {
        Logger::getInstance().error(std::string("Failed to configure SQLite connection: ") + e.what());
        close();
        return false;
    }

    Logger::getInstance().debug("Opened SQLite database " + path_ +
                                (mode_ == Mode::ReadOnly ? " (reader)" : " (writer)"));
    return true;
}

void DatabaseConnection::close() {
    if (db_) {
        const int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            Logger::getInstance().warning("sqlite3_close returned " + std::to_string(rc) + " for " + path_);
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
}

bool DatabaseConnection::isOpen() const {
    return db_ != nullptr;
}

void DatabaseConnection::fail(const std::string& context, int rc) {
    const std::string message = context + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    Logger::getInstance().debug("SQLite error " + std::to_string(rc) + " " + message);
    throw DatabaseError(message, db_ ? sqlite3_extended_errcode(db_) : rc);
}

QueryResult DatabaseConnection::execute(const std::string& sql, const std::vector<SqlValue>& params) {
    if (!db_) {
        throw DatabaseError("Database not open: " + path_, SQLITE_MISUSE);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        fail("prepare failed", rc);
    }

    const int expected = sqlite3_bind_parameter_count(stmt);
    if (expected != static_cast<int>(params.size())) {
        sqlite3_finalize(stmt);
        throw DatabaseError("expected " + std::to_string(expected) + " parameters, got " +
                            std::to_string(params.size()), SQLITE_RANGE);
    }

    for (size_t i = 0; i < params.size(); i++) {
        const int idx = static_cast<int>(i) + 1;
        const SqlValue& p = params[i];
        if (auto v = std::get_if<int64_t>(&p)) {
            rc = sqlite3_bind_int64(stmt, idx, *v);
        } else if (auto d = std::get_if<double>(&p)) {
            rc = sqlite3_bind_double(stmt, idx, *d);
        } else if (auto s = std::get_if<std::string>(&p)) {
            rc = sqlite3_bind_text(stmt, idx, s->c_str(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_null(stmt, idx);
        }
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            fail("bind failed", rc);
        }
    }

    QueryResult result;
    const int ncols = sqlite3_column_count(stmt);
    result.columns.reserve(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; c++) {
        result.columns.emplace_back(sqlite3_column_name(stmt, c));
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<SqlValue> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; c++) {
            switch (sqlite3_column_type(stmt, c)) {
                case SQLITE_INTEGER:
                    row.emplace_back(static_cast<int64_t>(sqlite3_column_int64(stmt, c)));
                    break;
                case SQLITE_FLOAT:
                    row.emplace_back(sqlite3_column_double(stmt, c));
                    break;
                case SQLITE_NULL:
                    row.emplace_back(nullptr);
                    break;
                default: {
                    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, c));
                    const int len = sqlite3_column_bytes(stmt, c);
                    row.emplace_back(text ? std::string(text, static_cast<size_t>(len)) : std::string());
                    break;
                }
            }
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        sqlite3_finalize(stmt);
        fail("step failed", rc);
    }

    result.changes = sqlite3_changes(db_);
    result.last_insert_id = sqlite3_last_insert_rowid(db_);
    sqlite3_finalize(stmt);
    return result;
}

void DatabaseConnection::executeScript(const std::string& sql) {
    if (!db_) {
        throw DatabaseError("Database not open: " + path_, SQLITE_MISUSE);
    }
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw DatabaseError("script failed: " + message, sqlite3_extended_errcode(db_));
    }
}

void DatabaseConnection::begin(bool immediate) {
    execute(immediate ? "BEGIN IMMEDIATE" : "BEGIN");
}

void DatabaseConnection::commit() {
    execute("COMMIT");
}

void DatabaseConnection::rollback() {
    if (inTransaction()) {
        execute("ROLLBACK");
    }
}

bool DatabaseConnection::inTransaction() const {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

std::string DatabaseConnection::getLastError() const {
    if (!db_) {
        return "database not open";
    }
    return sqlite3_errmsg(db_);
}

} // namespace forumbot
