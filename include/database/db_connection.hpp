#ifndef FORUMBOT_DB_CONNECTION_HPP
#define FORUMBOT_DB_CONNECTION_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "db_errors.hpp"

struct sqlite3;

namespace forumbot {

using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<SqlValue>> rows;
    int64_t last_insert_id = 0;
    int changes = 0;

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }

    bool isNull(size_t row, size_t col) const;
    // NULL reads as 0 / "" so nullable columns default the way the schema does.
    int64_t getInt(size_t row, size_t col) const;
    std::string getText(size_t row, size_t col) const;
};

class DatabaseConnection {
public:
    enum class Mode {
        ReadWrite,
        // Opened read-write at the file level but with PRAGMA query_only set.
        ReadOnly
    };

    explicit DatabaseConnection(const std::string& path, Mode mode = Mode::ReadWrite);
    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;

    bool open();
    void close();
    bool isOpen() const;

    // Runs one statement with positional (?) parameters. Throws DatabaseError.
    QueryResult execute(const std::string& sql, const std::vector<SqlValue>& params = {});
    // Runs several ';'-separated statements without parameters. Throws DatabaseError.
    void executeScript(const std::string& sql);

    void begin(bool immediate);
    void commit();
    void rollback();
    bool inTransaction() const;

    std::string getLastError() const;
    const std::string& path() const { return path_; }
    bool isMemory() const;

    static bool isMemoryPath(const std::string& path);

private:
    std::string path_;
    Mode mode_;
    sqlite3* db_;

    [[noreturn]] void fail(const std::string& context, int rc);
};

} // namespace forumbot

#endif // FORUMBOT_DB_CONNECTION_HPP
