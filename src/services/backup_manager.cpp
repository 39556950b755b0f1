#include "../../include/services/backup_manager.hpp"
#include "../../include/database/db_manager.hpp"
#include "../../include/telegram/chat_transport.hpp"
#include "../../include/utils/logger.hpp"

#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace forumbot {

namespace {

std::string quoteSql(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string literal(const SqlValue& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return "NULL";
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<double>::max_digits10) << *d;
        return oss.str();
    }
    return quoteSql(std::get<std::string>(value));
}

std::string formatNow(const char* format) {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, format);
    return oss.str();
}

} // namespace

BackupManager::BackupManager(DatabaseManager& db, ChatTransport& transport) : db_(db), transport_(transport) {
}

std::string BackupManager::dumpConnection(DatabaseConnection& conn) {
    std::ostringstream dump;
    dump << "BEGIN TRANSACTION;\n";

    QueryResult tables = conn.execute(
        "SELECT name, sql FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY name");
    for (size_t t = 0; t < tables.size(); t++) {
        const std::string name = tables.getText(t, 0);
        dump << tables.getText(t, 1) << ";\n";

        QueryResult rows = conn.execute("SELECT * FROM \"" + name + "\"");
        for (const auto& row : rows.rows) {
            dump << "INSERT INTO " << name << " VALUES (";
            for (size_t c = 0; c < row.size(); c++) {
                if (c > 0) dump << ", ";
                dump << literal(row[c]);
            }
            dump << ");\n";
        }
    }

    QueryResult indexes = conn.execute(
        "SELECT sql FROM sqlite_master WHERE type='index' AND sql IS NOT NULL ORDER BY name");
    for (size_t i = 0; i < indexes.size(); i++) {
        dump << indexes.getText(i, 0) << ";\n";
    }

    QueryResult version = conn.execute("PRAGMA user_version");
    if (!version.empty() && version.getInt(0, 0) > 0) {
        dump << "PRAGMA user_version = " << version.getInt(0, 0) << ";\n";
    }

    dump << "COMMIT;\n";
    return dump.str();
}

std::string BackupManager::createDump() {
    std::string dump = db_.queue().readSnapshot([](DatabaseConnection& conn) { return dumpConnection(conn); });
    Logger::getInstance().info("Database dump created (" + std::to_string(dump.size()) + " bytes)");
    return dump;
}

void BackupManager::restoreDump(DatabaseConnection& conn, const std::string& sql) {
    QueryResult existing = conn.execute(
        "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%'");
    if (!existing.empty() && existing.getInt(0, 0) > 0) {
        throw BackupError("restore target " + conn.path() + " is not empty");
    }

    try {
        conn.executeScript(sql);
    } catch (const DatabaseError&) {
        if (conn.inTransaction()) {
            conn.rollback();
        }
        throw;
    }
    Logger::getInstance().info("Dump restored into " + conn.path());
}

std::string BackupManager::backupFilename() {
    return "backup_" + formatNow("%Y-%m-%d_%H-%M-%S") + ".sql";
}

void BackupManager::sendBackup(int64_t chat_id) {
    const std::string dump = createDump();
    const std::string filename = backupFilename();
    const std::string caption = "✅ Бэкап базы данных создан: " + formatNow("%Y-%m-%d %H:%M:%S");

    SendResult sent = transport_.sendDocument(chat_id, filename, dump, caption);
    if (!sent.ok) {
        throw BackupError("failed to send backup file: " + sent.error);
    }
    Logger::getInstance().info("Backup " + filename + " sent to " + std::to_string(chat_id));
}

} // namespace forumbot
