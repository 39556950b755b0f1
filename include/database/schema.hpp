#ifndef FORUMBOT_SCHEMA_HPP
#define FORUMBOT_SCHEMA_HPP

#include <string>

#include "db_connection.hpp"

namespace forumbot {

// Versioned schema setup tracked in PRAGMA user_version.
//
// version 1: base tables and indexes
// version 2: reply targets on admin_state, user photo columns on published_posts
//
// Each step is idempotent: tables are created IF NOT EXISTS and a column is
// only added when PRAGMA table_info does not list it yet, so databases created
// before versioning existed converge to the same shape. Any other failure
// throws MigrationError.
class Schema {
public:
    static constexpr int kCurrentVersion = 2;

    // Runs inside the caller's transaction; does not BEGIN/COMMIT itself.
    static void apply(DatabaseConnection& conn);

    static int currentVersion(DatabaseConnection& conn);
    static bool hasTable(DatabaseConnection& conn, const std::string& table);
    static bool hasColumn(DatabaseConnection& conn, const std::string& table, const std::string& column);

private:
    static void createBaseTables(DatabaseConnection& conn);
    static void addReplyAndPhotoColumns(DatabaseConnection& conn);
    // Returns true when the column was added, false when it already existed.
    static bool addColumnIfMissing(DatabaseConnection& conn,
                                   const std::string& table,
                                   const std::string& column,
                                   const std::string& definition);
};

} // namespace forumbot

#endif // FORUMBOT_SCHEMA_HPP
