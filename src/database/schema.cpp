#include "../../include/database/schema.hpp"
#include "../../include/utils/logger.hpp"

namespace forumbot {

namespace {

const char* kBaseSchema = R"SQL(
CREATE TABLE IF NOT EXISTS admin_state (
    user_id INTEGER PRIMARY KEY,
    current_state TEXT NOT NULL DEFAULT '',
    selected_type_id INTEGER DEFAULT 0,
    draft_text TEXT DEFAULT '',
    draft_photo_id TEXT DEFAULT '',
    draft_entities TEXT DEFAULT '',
    editing_post_id INTEGER DEFAULT 0,
    editing_type_id INTEGER DEFAULT 0,
    temp_name TEXT DEFAULT '',
    temp_emoji TEXT DEFAULT '',
    temp_photo_id TEXT DEFAULT '',
    temp_template TEXT DEFAULT '',
    last_bot_message_id INTEGER DEFAULT 0
);

CREATE TABLE IF NOT EXISTS post_types (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    emoji TEXT DEFAULT '',
    photo_id TEXT DEFAULT '',
    template TEXT NOT NULL,
    template_entities TEXT DEFAULT '',
    is_active BOOLEAN DEFAULT TRUE,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS published_posts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    post_type_id INTEGER NOT NULL REFERENCES post_types(id),
    chat_id INTEGER NOT NULL,
    topic_id INTEGER NOT NULL,
    message_id INTEGER NOT NULL,
    text TEXT NOT NULL,
    photo_id TEXT DEFAULT '',
    entities TEXT DEFAULT '',
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    UNIQUE(chat_id, message_id)
);

CREATE TABLE IF NOT EXISTS admin_config (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS replies (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    chat_id INTEGER NOT NULL,
    reply_to_message_id INTEGER NOT NULL,
    message_id INTEGER NOT NULL,
    text TEXT NOT NULL DEFAULT '',
    photo_id TEXT DEFAULT '',
    entities TEXT DEFAULT '',
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    UNIQUE(chat_id, message_id)
);

CREATE INDEX IF NOT EXISTS idx_published_posts_message ON published_posts(chat_id, message_id);
CREATE INDEX IF NOT EXISTS idx_post_types_active ON post_types(is_active);
CREATE INDEX IF NOT EXISTS idx_replies_message ON replies(chat_id, message_id);
)SQL";

} // namespace

void Schema::apply(DatabaseConnection& conn) {
    try {
        const int from = currentVersion(conn);
        if (from > kCurrentVersion) {
            throw MigrationError("database schema version " + std::to_string(from) +
                                 " is newer than supported version " + std::to_string(kCurrentVersion));
        }

        if (from < 1) {
            createBaseTables(conn);
        }
        if (from < 2) {
            addReplyAndPhotoColumns(conn);
        }

        if (from != kCurrentVersion) {
            // PRAGMA does not take bound parameters.
            conn.execute("PRAGMA user_version = " + std::to_string(kCurrentVersion));
            Logger::getInstance().info("Schema migrated from version " + std::to_string(from) +
                                       " to " + std::to_string(kCurrentVersion));
        } else {
            Logger::getInstance().debug("Schema already at version " + std::to_string(from));
        }
    } catch (const DatabaseError& e) {
        throw MigrationError(std::string("schema setup failed: ") + e.what());
    }
}

int Schema::currentVersion(DatabaseConnection& conn) {
    QueryResult res = conn.execute("PRAGMA user_version");
    return res.empty() ? 0 : static_cast<int>(res.getInt(0, 0));
}

bool Schema::hasTable(DatabaseConnection& conn, const std::string& table) {
    QueryResult res = conn.execute(
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?",
        {SqlValue(table)});
    return !res.empty();
}

bool Schema::hasColumn(DatabaseConnection& conn, const std::string& table, const std::string& column) {
    QueryResult res = conn.execute("SELECT name FROM pragma_table_info(?)", {SqlValue(table)});
    for (size_t i = 0; i < res.size(); i++) {
        if (res.getText(i, 0) == column) {
            return true;
        }
    }
    return false;
}

void Schema::createBaseTables(DatabaseConnection& conn) {
    conn.executeScript(kBaseSchema);
}

void Schema::addReplyAndPhotoColumns(DatabaseConnection& conn) {
    addColumnIfMissing(conn, "admin_state", "reply_target_chat_id", "INTEGER DEFAULT 0");
    addColumnIfMissing(conn, "admin_state", "reply_target_message_id", "INTEGER DEFAULT 0");
    addColumnIfMissing(conn, "admin_state", "draft_user_photo_id", "TEXT DEFAULT ''");
    addColumnIfMissing(conn, "published_posts", "user_photo_id", "TEXT DEFAULT ''");
    addColumnIfMissing(conn, "published_posts", "user_photo_message_id", "INTEGER DEFAULT 0");
}

bool Schema::addColumnIfMissing(DatabaseConnection& conn,
                                const std::string& table,
                                const std::string& column,
                                const std::string& definition) {
    if (!hasTable(conn, table)) {
        throw MigrationError("cannot add column " + column + ": table " + table + " does not exist");
    }
    if (hasColumn(conn, table, column)) {
        Logger::getInstance().debug("Column " + table + "." + column + " already present");
        return false;
    }
    conn.execute("ALTER TABLE " + table + " ADD COLUMN " + column + " " + definition);
    Logger::getInstance().info("Added column " + table + "." + column);
    return true;
}

} // namespace forumbot
