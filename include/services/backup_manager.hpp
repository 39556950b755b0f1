#ifndef FORUMBOT_BACKUP_MANAGER_HPP
#define FORUMBOT_BACKUP_MANAGER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace forumbot {

class DatabaseConnection;
class DatabaseManager;
class ChatTransport;

class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& what) : std::runtime_error(what) {}
};

// Text SQL dumps of the whole store.
//
// A dump is taken inside one read transaction on a reader connection, never
// as a write job, so it sees a single consistent snapshot and does not hold
// up the queue.
class BackupManager {
public:
    BackupManager(DatabaseManager& db, ChatTransport& transport);

    // "BEGIN TRANSACTION;" + every table's CREATE and one INSERT per row + "COMMIT;".
    std::string createDump();

    // Uploads a fresh dump as backup_<timestamp>.sql. Throws BackupError or DatabaseError.
    void sendBackup(int64_t chat_id);

    // Builds the dump text from an open connection.
    static std::string dumpConnection(DatabaseConnection& conn);

    // Replays a dump into an empty database. Throws BackupError when the
    // target already has tables, DatabaseError when a statement fails.
    static void restoreDump(DatabaseConnection& conn, const std::string& sql);

    static std::string backupFilename();

private:
    DatabaseManager& db_;
    ChatTransport& transport_;
};

} // namespace forumbot

#endif // FORUMBOT_BACKUP_MANAGER_HPP
